#include "engine/report_builder.hpp"

#include <exception>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/fingerprint_describer.hpp"
#include "store/warehouse_sink.hpp"

namespace buildtrace {

namespace {

std::string lookup(const ObjectMap *objects, const std::string &key)
{
    if (!objects) {
        return {};
    }
    auto it = objects->find(key);
    return it == objects->end() ? std::string() : it->second;
}

void appendCount(std::vector<std::string> &parts, size_t count, const char *what)
{
    if (count > 0) {
        parts.push_back(std::to_string(count) + " item(s) " + what);
    }
}

} // namespace

MetricsRecord makeMetricsRecord(const ChangeSet &changeSet, const SnapshotMeta &current)
{
    MetricsRecord record;
    record.timestamp = current.timestamp;
    record.jobId = current.jobId;
    record.latencyMs = current.latencyMs;

    // Moves stay inside added/removed, so they count there and nowhere else.
    record.totalAdded = static_cast<int64_t>(changeSet.added.size());
    record.totalRemoved = static_cast<int64_t>(changeSet.removed.size());
    record.totalModified = static_cast<int64_t>(changeSet.modified.size());
    record.totalUnchanged = static_cast<int64_t>(changeSet.unchanged.size());
    return record;
}

std::string summarizeReport(const ChangeReport &report)
{
    std::vector<std::string> parts;
    appendCount(parts, report.added.size(), "added.");
    appendCount(parts, report.removed.size(), "removed.");
    appendCount(parts, report.moved.size(), "moved to a new key.");
    appendCount(parts, report.modified.size(), "moved/modified.");

    if (parts.empty()) {
        return "No significant changes detected.";
    }
    std::string summary = parts.front();
    for (size_t i = 1; i < parts.size(); ++i) {
        summary += " | " + parts[i];
    }
    return summary;
}

ReportBuilder::ReportBuilder(WarehouseSink *sink)
    : m_sink(sink)
{
}

ReportBuildResult ReportBuilder::build(const ChangeSet &changeSet,
                                       const SnapshotMeta &previous,
                                       const SnapshotMeta &current) const
{
    return buildWithObjects(changeSet, previous, current, nullptr, nullptr);
}

ReportBuildResult ReportBuilder::build(const ChangeSet &changeSet,
                                       const JobSnapshot &previous,
                                       const JobSnapshot &current) const
{
    return buildWithObjects(changeSet, previous.meta(), current.meta(),
                            &previous.objects, &current.objects);
}

ReportBuildResult ReportBuilder::buildWithObjects(const ChangeSet &changeSet,
                                                  const SnapshotMeta &previous,
                                                  const SnapshotMeta &current,
                                                  const ObjectMap *previousObjects,
                                                  const ObjectMap *currentObjects) const
{
    ReportBuildResult result;
    result.metrics = makeMetricsRecord(changeSet, current);

    ChangeReport &report = result.report;
    report.jobId = current.jobId;
    if (previous.jobId > 0) {
        report.previousJobId = previous.jobId;
    }
    report.metrics = result.metrics;

    std::set<std::string> moveSources;
    std::set<std::string> moveTargets;
    for (const auto &move : changeSet.moves) {
        moveSources.insert(move.fromKey);
        moveTargets.insert(move.toKey);
        report.moved.push_back({move.fromKey, move.toKey, move.fingerprint, describeMove(move)});
    }

    for (const auto &key : changeSet.added) {
        if (moveTargets.count(key) > 0) {
            continue;
        }
        const std::string fingerprint = lookup(currentObjects, key);
        report.added.push_back({key, currentObjects ? describeAddition(key, fingerprint)
                                                    : key + " added"});
    }

    for (const auto &key : changeSet.removed) {
        if (moveSources.count(key) > 0) {
            continue;
        }
        report.removed.push_back({key, describeRemoval(key)});
    }

    for (const auto &key : changeSet.modified) {
        const std::string before = lookup(previousObjects, key);
        const std::string after = lookup(currentObjects, key);
        const std::string description = (previousObjects && currentObjects)
            ? describeModification(key, before, after)
            : key + " modified";
        report.modified.push_back({key, before, after, description});
    }

    report.summary = summarizeReport(report);
    report.warehouseStatus = emitMetrics(result.metrics);
    return result;
}

WarehouseStatus ReportBuilder::emitMetrics(const MetricsRecord &record) const
{
    WarehouseStatus status;
    if (!m_sink) {
        return status;
    }

    try {
        m_sink->insert(record);
        status.state = WarehouseInsertState::Succeeded;
    } catch (const std::exception &ex) {
        status.state = WarehouseInsertState::Failed;
        status.message = ex.what();
        BTLOG_ERROR(QStringLiteral("ReportBuilder"),
                    QStringLiteral("emitMetrics"),
                    QStringLiteral("warehouse_insert_failed"),
                    QStringLiteral("best_effort_metrics"),
                    QStringLiteral("warehouse_sink"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"jobId", record.jobId}, {"error", ex.what()}}));
        return status;
    }

    BTLOG_DEBUG(QStringLiteral("ReportBuilder"),
                QStringLiteral("emitMetrics"),
                QStringLiteral("warehouse_insert_succeeded"),
                QStringLiteral("best_effort_metrics"),
                QStringLiteral("warehouse_sink"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"jobId", record.jobId}}));
    return status;
}

} // namespace buildtrace
