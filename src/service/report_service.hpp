#pragma once

#include <cstdint>
#include <vector>

#include "common/models.hpp"

namespace buildtrace {

class PredecessorResolver;
class SnapshotStore;
class WarehouseSink;

/**
 * ReportService composes one reporting request:
 * fetch current -> resolve predecessor -> fetch previous -> diff -> build.
 *
 * Fetch failures (NotFoundError, StoreUnavailableError) propagate and no
 * partial report is produced. Warehouse failures never propagate; they are
 * reported through ChangeReport::warehouseStatus.
 *
 * Holds no mutable state of its own; concurrent calls are safe as long as
 * the collaborators are.
 */
class ReportService {
public:
    ReportService(SnapshotStore &store,
                  const PredecessorResolver &resolver,
                  WarehouseSink *sink);

    // Validates every snapshot first, then stores them in order. The first
    // storage failure aborts the batch; earlier snapshots stay stored.
    size_t ingest(const std::vector<JobSnapshot> &snapshots);

    ChangeReport report(int64_t jobId) const;

    // Raw diff between two stored jobs. Does not touch the warehouse.
    ChangeSet diffJobs(int64_t previousJobId, int64_t currentJobId) const;

private:
    JobSnapshot fetchValidated(int64_t jobId) const;

    SnapshotStore &m_store;
    const PredecessorResolver &m_resolver;
    WarehouseSink *m_sink;
};

} // namespace buildtrace
