#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace buildtrace {

/*
  Storage contract for job snapshots.

  fetch() throws NotFoundError when nothing is stored for the job and
  StoreUnavailableError on storage failure. put() throws
  StoreUnavailableError, or SnapshotConflictError when different content is
  already stored under the job id. Implementations do not retry.
*/
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual JobSnapshot fetch(int64_t jobId) const = 0;
    virtual void put(const JobSnapshot &snapshot) = 0;

    virtual std::optional<int64_t> latestJobBefore(int64_t jobId) const = 0;
    virtual std::vector<SnapshotMeta> listSnapshots() const = 0;
};

} // namespace buildtrace
