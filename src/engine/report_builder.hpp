#pragma once

#include <string>

#include "common/models.hpp"

namespace buildtrace {

class WarehouseSink;

struct ReportBuildResult {
    MetricsRecord metrics;
    ChangeReport report;
};

MetricsRecord makeMetricsRecord(const ChangeSet &changeSet, const SnapshotMeta &current);

// One-line summary, e.g. "2 item(s) added. | 1 item(s) moved/modified."
std::string summarizeReport(const ChangeReport &report);

/**
 * ReportBuilder turns a ChangeSet into the warehouse metrics row and the
 * caller-facing ChangeReport.
 *
 * The metrics row is handed to the sink (when one is configured) on a
 * best-effort basis: insertion failures are logged and recorded in
 * ChangeReport::warehouseStatus, never thrown to the caller.
 */
class ReportBuilder {
public:
    explicit ReportBuilder(WarehouseSink *sink = nullptr);

    ReportBuildResult build(const ChangeSet &changeSet,
                            const SnapshotMeta &previous,
                            const SnapshotMeta &current) const;

    // Same as above, with fingerprint-based descriptions for every entry.
    ReportBuildResult build(const ChangeSet &changeSet,
                            const JobSnapshot &previous,
                            const JobSnapshot &current) const;

private:
    ReportBuildResult buildWithObjects(const ChangeSet &changeSet,
                                       const SnapshotMeta &previous,
                                       const SnapshotMeta &current,
                                       const ObjectMap *previousObjects,
                                       const ObjectMap *currentObjects) const;
    WarehouseStatus emitMetrics(const MetricsRecord &record) const;

    WarehouseSink *m_sink;
};

} // namespace buildtrace
