#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace buildtrace {

class SnapshotStore;

// Decides which job a report diffs against. Returning nullopt means the job
// has no predecessor and is compared with an empty baseline.
class PredecessorResolver {
public:
    virtual ~PredecessorResolver() = default;

    virtual std::optional<int64_t> resolve(int64_t jobId) const = 0;
    virtual std::string name() const = 0;
};

// jobId - 1. Assumes contiguous job ids; a gap makes the report compare
// against the wrong job (or fail with NotFoundError).
class DecrementPredecessorResolver : public PredecessorResolver {
public:
    std::optional<int64_t> resolve(int64_t jobId) const override;
    std::string name() const override;
};

// Greatest job id stored below jobId. Tolerates gaps in the id sequence.
class LatestStoredPredecessorResolver : public PredecessorResolver {
public:
    explicit LatestStoredPredecessorResolver(const SnapshotStore &store);

    std::optional<int64_t> resolve(int64_t jobId) const override;
    std::string name() const override;

private:
    const SnapshotStore &m_store;
};

// "decrement" or "latest_stored"; throws ConfigError otherwise.
std::unique_ptr<PredecessorResolver> makePredecessorResolver(const std::string &strategy,
                                                             const SnapshotStore &store);

} // namespace buildtrace
