#include "service/report_service.hpp"

#include <chrono>

#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/diff_engine.hpp"
#include "engine/predecessor.hpp"
#include "engine/report_builder.hpp"
#include "store/snapshot_store.hpp"

namespace buildtrace {

namespace {

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace

ReportService::ReportService(SnapshotStore &store,
                             const PredecessorResolver &resolver,
                             WarehouseSink *sink)
    : m_store(store)
    , m_resolver(resolver)
    , m_sink(sink)
{
}

size_t ReportService::ingest(const std::vector<JobSnapshot> &snapshots)
{
    for (const auto &snapshot : snapshots) {
        validateSnapshot(snapshot);
    }

    for (const auto &snapshot : snapshots) {
        m_store.put(snapshot);
    }

    BTLOG_INFO(QStringLiteral("ReportService"),
               QStringLiteral("ingest"),
               QStringLiteral("jobs_ingested"),
               QStringLiteral("client_submission"),
               QStringLiteral("snapshot_store"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"jobs", snapshots.size()}}));
    return snapshots.size();
}

JobSnapshot ReportService::fetchValidated(int64_t jobId) const
{
    JobSnapshot snapshot = m_store.fetch(jobId);
    validateSnapshot(snapshot);
    return snapshot;
}

ChangeReport ReportService::report(int64_t jobId) const
{
    const QString corr = logging::currentCorrelationId().isEmpty()
        ? newCorrelationId()
        : logging::currentCorrelationId();
    logging::CorrelationScope corrScope(corr);

    if (jobId <= 0) {
        throw InvalidRequestError("Job ID must be positive.");
    }

    const auto start = std::chrono::steady_clock::now();
    const JobSnapshot current = fetchValidated(jobId);

    // A job without a predecessor is compared with an empty baseline.
    JobSnapshot previous;
    const std::optional<int64_t> previousJobId = m_resolver.resolve(jobId);
    if (previousJobId.has_value()) {
        previous = fetchValidated(*previousJobId);
    }

    BTLOG_DEBUG(QStringLiteral("ReportService"),
                QStringLiteral("report"),
                QStringLiteral("predecessor_resolved"),
                QStringLiteral("report_request"),
                QString::fromStdString(m_resolver.name()),
                logging::defaultWho(),
                corr,
                (nlohmann::json{{"jobId", jobId},
                                {"previousJobId", previousJobId.has_value()
                                     ? nlohmann::json(*previousJobId)
                                     : nlohmann::json()}}));

    const ChangeSet changeSet = diffSnapshots(previous, current);
    const ReportBuilder builder(m_sink);
    ReportBuildResult result = builder.build(changeSet, previous, current);

    BTLOG_INFO(QStringLiteral("ReportService"),
               QStringLiteral("report"),
               QStringLiteral("report_built"),
               QStringLiteral("report_request"),
               QStringLiteral("snapshot_diff"),
               logging::defaultWho(),
               corr,
               (nlohmann::json{{"jobId", jobId},
                               {"metrics", result.metrics},
                               {"moves", changeSet.moves.size()},
                               {"warehouse", toWarehouseStateString(
                                                 result.report.warehouseStatus.state)},
                               {"durationMs",
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start).count()}}));
    return std::move(result.report);
}

ChangeSet ReportService::diffJobs(int64_t previousJobId, int64_t currentJobId) const
{
    const JobSnapshot previous = fetchValidated(previousJobId);
    const JobSnapshot current = fetchValidated(currentJobId);
    return diffSnapshots(previous, current);
}

} // namespace buildtrace
