#include "report/ReportCli.hpp"

#include <iostream>
#include <limits>
#include <memory>
#include <optional>

#include <QFile>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/predecessor.hpp"
#include "service/report_service.hpp"
#include "sim/job_simulator.hpp"
#include "store/sqlite_snapshot_store.hpp"
#include "store/sqlite_warehouse_sink.hpp"

namespace buildtrace {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitNotFound = 2;
constexpr int kExitStore = 3;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  buildtrace-report ingest --input PATH\n"
        "  buildtrace-report report --job ID [--format markdown|json]\n"
        "  buildtrace-report diff --previous ID --current ID [--format markdown|json]\n"
        "  buildtrace-report metrics [--format markdown|json]\n"
        "  buildtrace-report simulate --jobs N [--objects M] [--seed S] [--out PATH]\n"
        "Global options: --trace, --log-level debug|info|warn|error\n");
}

std::string dumpJson(const nlohmann::json &payload)
{
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void renderList(const char *title, const std::vector<ChangeReport::Entry> &entries)
{
    std::cout << "## " << title << " (" << entries.size() << ")\n\n";
    if (entries.empty()) {
        std::cout << "None.\n\n";
        return;
    }
    for (const auto &entry : entries) {
        std::cout << "- " << entry.description << "\n";
    }
    std::cout << "\n";
}

void renderReportMarkdown(const ChangeReport &report)
{
    std::cout << "# BuildTrace Change Report\n\n";
    std::cout << "Job: " << report.jobId << "\n";
    if (report.previousJobId.has_value()) {
        std::cout << "Compared with job: " << *report.previousJobId << "\n";
    } else {
        std::cout << "Compared with job: none (first job)\n";
    }
    std::cout << "Timestamp: " << toIso8601Utc(report.metrics.timestamp) << "\n";
    std::cout << "Latency: " << report.metrics.latencyMs << " ms\n\n";

    std::cout << "## Totals\n\n";
    std::cout << "- Added: " << report.metrics.totalAdded << "\n";
    std::cout << "- Removed: " << report.metrics.totalRemoved << "\n";
    std::cout << "- Modified: " << report.metrics.totalModified << "\n";
    std::cout << "- Unchanged: " << report.metrics.totalUnchanged << "\n\n";

    renderList("Added", report.added);
    renderList("Removed", report.removed);

    std::cout << "## Moved to a new key (" << report.moved.size() << ")\n\n";
    if (report.moved.empty()) {
        std::cout << "None.\n\n";
    } else {
        for (const auto &entry : report.moved) {
            std::cout << "- " << entry.description << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "## Moved or modified (" << report.modified.size() << ")\n\n";
    if (report.modified.empty()) {
        std::cout << "None.\n\n";
    } else {
        for (const auto &entry : report.modified) {
            std::cout << "- " << entry.description << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Summary: " << report.summary << "\n";
    std::cout << "Metrics status: " << describeWarehouseStatus(report.warehouseStatus) << "\n";
}

void renderKeys(const char *title, const std::vector<std::string> &keys)
{
    std::cout << "## " << title << " (" << keys.size() << ")\n\n";
    for (const auto &key : keys) {
        std::cout << "- " << key << "\n";
    }
    if (keys.empty()) {
        std::cout << "None.\n";
    }
    std::cout << "\n";
}

void renderChangeSetMarkdown(const ChangeSet &changeSet)
{
    std::cout << "# BuildTrace Snapshot Diff\n\n";
    std::cout << "From job: " << changeSet.previousJobId << "\n";
    std::cout << "To job:   " << changeSet.currentJobId << "\n\n";

    renderKeys("Added", changeSet.added);
    renderKeys("Removed", changeSet.removed);
    renderKeys("Modified", changeSet.modified);

    std::cout << "## Moves (" << changeSet.moves.size() << ")\n\n";
    for (const auto &move : changeSet.moves) {
        std::cout << "- " << move.fromKey << " -> " << move.toKey << "\n";
    }
    if (changeSet.moves.empty()) {
        std::cout << "None.\n";
    }
    std::cout << "\nUnchanged: " << changeSet.unchanged.size() << "\n";
}

void renderMetricsMarkdown(const std::vector<MetricsRecord> &records)
{
    std::cout << "# BuildTrace Metrics\n\n";
    if (records.empty()) {
        std::cout << "No metrics recorded.\n";
        return;
    }
    std::cout << "| timestamp | job | latency_ms | added | removed | modified | unchanged |\n";
    std::cout << "|---|---|---|---|---|---|---|\n";
    for (const auto &record : records) {
        std::cout << "| " << toIso8601Utc(record.timestamp)
                  << " | " << record.jobId
                  << " | " << record.latencyMs
                  << " | " << record.totalAdded
                  << " | " << record.totalRemoved
                  << " | " << record.totalModified
                  << " | " << record.totalUnchanged << " |\n";
    }
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<ReportFormat> getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format")).toLower();
    if (value.isEmpty() || value == QStringLiteral("markdown")) {
        return ReportFormat::Markdown;
    }
    if (value == QStringLiteral("json")) {
        return ReportFormat::Json;
    }
    return std::nullopt;
}

std::optional<int64_t> parsePositiveInt(const QString &value)
{
    bool ok = false;
    const qlonglong parsed = value.toLongLong(&ok);
    if (!ok || parsed <= 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

// Counts that feed int-sized APIs: positive and no larger than INT_MAX.
std::optional<int> parseCount(const QString &value)
{
    const auto parsed = parsePositiveInt(value);
    if (!parsed.has_value() || *parsed > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*parsed);
}

// Runs one command body, translating the error taxonomy into exit codes.
template<typename Fn>
int runGuarded(const char *command, Fn &&body)
{
    QString failure;
    int code = kExitOk;
    try {
        return body();
    } catch (const NotFoundError &ex) {
        failure = QString::fromUtf8(ex.what());
        code = kExitNotFound;
    } catch (const StoreUnavailableError &ex) {
        failure = QString::fromUtf8(ex.what());
        code = kExitStore;
    } catch (const BuildTraceError &ex) {
        failure = QString::fromUtf8(ex.what());
        code = kExitUsage;
    }

    BTLOG_ERROR(QStringLiteral("ReportCli"),
                QStringLiteral("runGuarded"),
                QStringLiteral("report_cli_failed"),
                QStringLiteral("user_invocation"),
                QStringLiteral("cli"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"command", command}, {"what", failure.toStdString()}}));
    std::cerr << failure.toStdString() << std::endl;
    return code;
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    BTLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});
    if (command == QStringLiteral("ingest")) {
        return runIngest(args);
    }
    if (command == QStringLiteral("report")) {
        return runReport(args);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(args);
    }
    if (command == QStringLiteral("metrics")) {
        return runMetrics(args);
    }
    if (command == QStringLiteral("simulate")) {
        return runSimulate(args);
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

int ReportCli::runIngest(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    return runGuarded("ingest", [&]() {
        QFile file(inputPath);
        if (!file.open(QIODevice::ReadOnly)) {
            std::cerr << "Cannot read " << inputPath.toStdString() << std::endl;
            return kExitUsage;
        }
        const auto snapshots = parseJobSubmissions(parseStrictJson(file.readAll().toStdString()));

        const ServiceConfig config = loadServiceConfig();
        SqliteSnapshotStore store(config.snapshotDbPath);
        DecrementPredecessorResolver resolver;
        ReportService service(store, resolver, nullptr);
        const size_t accepted = service.ingest(snapshots);

        std::cout << "Jobs accepted and state stored. Ready for reporting. ("
                  << accepted << " job(s))" << std::endl;
        return kExitOk;
    });
}

int ReportCli::runReport(const QStringList &args)
{
    // Change reports diff a job against its predecessor and log metrics.
    const auto jobId = parsePositiveInt(getArgValue(args, QStringLiteral("--job")));
    if (!jobId.has_value()) {
        std::cerr << "Job ID must be positive." << std::endl;
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    const auto format = getFormat(args);
    if (!format.has_value()) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    return runGuarded("report", [&]() {
        const ServiceConfig config = loadServiceConfig();
        SqliteSnapshotStore store(config.snapshotDbPath);
        std::unique_ptr<SqliteWarehouseSink> warehouse;
        if (config.warehouseEnabled) {
            warehouse = std::make_unique<SqliteWarehouseSink>(config.warehouseDbPath);
        }
        const auto resolver = makePredecessorResolver(config.predecessorStrategy, store);
        const ReportService service(store, *resolver, warehouse.get());

        const ChangeReport report = service.report(*jobId);
        if (*format == ReportFormat::Json) {
            std::cout << dumpJson(nlohmann::json(report)) << std::endl;
        } else {
            renderReportMarkdown(report);
        }
        return kExitOk;
    });
}

int ReportCli::runDiff(const QStringList &args)
{
    const auto previousId = parsePositiveInt(getArgValue(args, QStringLiteral("--previous")));
    const auto currentId = parsePositiveInt(getArgValue(args, QStringLiteral("--current")));
    if (!previousId.has_value() || !currentId.has_value()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    const auto format = getFormat(args);
    if (!format.has_value()) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    return runGuarded("diff", [&]() {
        const ServiceConfig config = loadServiceConfig();
        SqliteSnapshotStore store(config.snapshotDbPath);
        DecrementPredecessorResolver resolver;
        const ReportService service(store, resolver, nullptr);

        const ChangeSet changeSet = service.diffJobs(*previousId, *currentId);
        if (*format == ReportFormat::Json) {
            std::cout << dumpJson(nlohmann::json(changeSet)) << std::endl;
        } else {
            renderChangeSetMarkdown(changeSet);
        }
        return kExitOk;
    });
}

int ReportCli::runMetrics(const QStringList &args)
{
    const auto format = getFormat(args);
    if (!format.has_value()) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    return runGuarded("metrics", [&]() {
        const ServiceConfig config = loadServiceConfig();
        const SqliteWarehouseSink warehouse(config.warehouseDbPath);
        const auto records = warehouse.listRecords();
        if (*format == ReportFormat::Json) {
            std::cout << dumpJson(nlohmann::json{{"records", records}}) << std::endl;
        } else {
            renderMetricsMarkdown(records);
        }
        return kExitOk;
    });
}

int ReportCli::runSimulate(const QStringList &args)
{
    const auto jobs = parseCount(getArgValue(args, QStringLiteral("--jobs")));
    if (!jobs.has_value()) {
        std::cerr << "--jobs must be a positive integer no larger than "
                  << std::numeric_limits<int>::max() << "." << std::endl;
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    int objects = 50;
    const QString objectsValue = getArgValue(args, QStringLiteral("--objects"));
    if (!objectsValue.isEmpty()) {
        const auto parsed = parseCount(objectsValue);
        if (!parsed.has_value()) {
            std::cerr << "--objects must be a positive integer no larger than "
                      << std::numeric_limits<int>::max() << "." << std::endl;
            return kExitUsage;
        }
        objects = *parsed;
    }

    uint64_t seed = 1;
    const QString seedValue = getArgValue(args, QStringLiteral("--seed"));
    if (!seedValue.isEmpty()) {
        bool ok = false;
        seed = seedValue.toULongLong(&ok);
        if (!ok) {
            std::cerr << "--seed must be a non-negative integer." << std::endl;
            return kExitUsage;
        }
    }

    JobSimulator simulator(seed, objects);
    const nlohmann::json payload = simulator.generate(*jobs);

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        std::cout << payload.dump(2) << std::endl;
        return kExitOk;
    }

    QFile file(outPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        std::cerr << "Cannot write " << outPath.toStdString() << std::endl;
        return kExitUsage;
    }
    const QByteArray data = QByteArray::fromStdString(payload.dump(2));
    if (file.write(data) != data.size()) {
        std::cerr << "Short write to " << outPath.toStdString() << std::endl;
        return kExitUsage;
    }

    BTLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runSimulate"),
               QStringLiteral("jobs_simulated"),
               QStringLiteral("user_invocation"),
               QStringLiteral("job_simulator"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"jobs", *jobs}, {"seed", seed}, {"out", outPath.toStdString()}}));
    std::cout << "Wrote " << *jobs << " job(s) to " << outPath.toStdString() << std::endl;
    return kExitOk;
}

} // namespace buildtrace
