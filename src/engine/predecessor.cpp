#include "engine/predecessor.hpp"

#include "common/errors.hpp"
#include "store/snapshot_store.hpp"

namespace buildtrace {

std::optional<int64_t> DecrementPredecessorResolver::resolve(int64_t jobId) const
{
    if (jobId <= 1) {
        return std::nullopt;
    }
    return jobId - 1;
}

std::string DecrementPredecessorResolver::name() const
{
    return "decrement";
}

LatestStoredPredecessorResolver::LatestStoredPredecessorResolver(const SnapshotStore &store)
    : m_store(store)
{
}

std::optional<int64_t> LatestStoredPredecessorResolver::resolve(int64_t jobId) const
{
    return m_store.latestJobBefore(jobId);
}

std::string LatestStoredPredecessorResolver::name() const
{
    return "latest_stored";
}

std::unique_ptr<PredecessorResolver> makePredecessorResolver(const std::string &strategy,
                                                             const SnapshotStore &store)
{
    if (strategy == "decrement") {
        return std::make_unique<DecrementPredecessorResolver>();
    }
    if (strategy == "latest_stored") {
        return std::make_unique<LatestStoredPredecessorResolver>(store);
    }
    throw ConfigError("unknown predecessor strategy '" + strategy + "'");
}

} // namespace buildtrace
