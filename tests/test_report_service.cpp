#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>
#include <optional>
#include <vector>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "engine/predecessor.hpp"
#include "service/report_service.hpp"
#include "store/snapshot_store.hpp"
#include "store/sqlite_snapshot_store.hpp"
#include "store/sqlite_warehouse_sink.hpp"

namespace {

class FailingSink : public buildtrace::WarehouseSink {
public:
    void insert(const buildtrace::MetricsRecord &) override
    {
        throw buildtrace::WarehouseInsertError("connection refused");
    }
};

class CountingSink : public buildtrace::WarehouseSink {
public:
    void insert(const buildtrace::MetricsRecord &) override
    {
        ++inserts;
    }

    int inserts = 0;
};

// Serves one stored job and fails every other storage read.
class FlakyStore : public buildtrace::SnapshotStore {
public:
    explicit FlakyStore(buildtrace::JobSnapshot current)
        : m_current(std::move(current))
    {
    }

    buildtrace::JobSnapshot fetch(int64_t jobId) const override
    {
        if (jobId == m_current.jobId) {
            return m_current;
        }
        throw buildtrace::StoreUnavailableError("database is locked");
    }

    void put(const buildtrace::JobSnapshot &) override
    {
        throw buildtrace::StoreUnavailableError("database is locked");
    }

    std::optional<int64_t> latestJobBefore(int64_t) const override
    {
        throw buildtrace::StoreUnavailableError("database is locked");
    }

    std::vector<buildtrace::SnapshotMeta> listSnapshots() const override
    {
        throw buildtrace::StoreUnavailableError("database is locked");
    }

private:
    buildtrace::JobSnapshot m_current;
};

buildtrace::JobSnapshot makeSnapshot(int64_t jobId, buildtrace::ObjectMap objects)
{
    buildtrace::JobSnapshot snapshot;
    snapshot.jobId = jobId;
    snapshot.timestamp = *buildtrace::fromIso8601Utc("2024-01-01T00:00:00Z")
        + std::chrono::minutes(jobId - 1);
    snapshot.latencyMs = 1500;
    snapshot.objects = std::move(objects);
    return snapshot;
}

} // namespace

class ReportServiceTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testFirstJobUsesEmptyBaseline();
    void testReportAgainstPredecessor();
    void testWarehouseRowWritten();
    void testWarehouseFailureKeepsReport();
    void testDecrementGapFails();
    void testLatestStoredBridgesGap();
    void testUnknownJob();
    void testNonPositiveJob();
    void testIngestValidatesWholeBatch();
    void testDiffJobs();
    void testPredecessorStoreFailurePropagates();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;
    std::unique_ptr<buildtrace::SqliteSnapshotStore> m_store;

    std::string freshPath(const char *name);
};

void ReportServiceTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportServiceTests::cleanupTestCase()
{
    m_store.reset();
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string ReportServiceTests::freshPath(const char *name)
{
    return m_tempDir.filePath(QStringLiteral("%1-%2.db").arg(QString::fromLatin1(name)).arg(++m_dbCounter))
        .toStdString();
}

void ReportServiceTests::init()
{
    m_store = std::make_unique<buildtrace::SqliteSnapshotStore>(freshPath("snapshots"));
}

void ReportServiceTests::testFirstJobUsesEmptyBaseline()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, nullptr);
    service.ingest({makeSnapshot(1, {{"a", "1"}, {"b", "2"}, {"c", "3"}})});

    const auto report = service.report(1);
    QCOMPARE(report.jobId, static_cast<int64_t>(1));
    QVERIFY(!report.previousJobId.has_value());
    QCOMPARE(report.metrics.totalAdded, static_cast<int64_t>(3));
    QCOMPARE(report.metrics.totalRemoved, static_cast<int64_t>(0));
    QCOMPARE(report.added.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(report.summary), QStringLiteral("3 item(s) added."));
}

void ReportServiceTests::testReportAgainstPredecessor()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, nullptr);
    service.ingest({
        makeSnapshot(41, {{"W001", "wall_10_10_5_5"}, {"D002", "door_1_1_1_2"}, {"C003", "column_3_3_1_1"}}),
        makeSnapshot(42, {{"W100", "wall_10_10_5_5"}, {"D002", "door_2_1_1_2"}, {"C003", "column_3_3_1_1"}})
    });

    const auto report = service.report(42);
    QVERIFY(report.previousJobId.has_value());
    QCOMPARE(*report.previousJobId, static_cast<int64_t>(41));
    QCOMPARE(report.metrics.totalAdded, static_cast<int64_t>(1));
    QCOMPARE(report.metrics.totalRemoved, static_cast<int64_t>(1));
    QCOMPARE(report.metrics.totalModified, static_cast<int64_t>(1));
    QCOMPARE(report.metrics.totalUnchanged, static_cast<int64_t>(1));
    QCOMPARE(report.moved.size(), static_cast<size_t>(1));
    QVERIFY(report.added.empty());
    QVERIFY(report.removed.empty());
    QCOMPARE(QString::fromStdString(report.modified.front().description),
             QStringLiteral("D002 (door) moved 1 units east"));
    QCOMPARE(QString::fromStdString(report.summary),
             QStringLiteral("1 item(s) moved to a new key. | 1 item(s) moved/modified."));
}

void ReportServiceTests::testWarehouseRowWritten()
{
    buildtrace::SqliteWarehouseSink warehouse(freshPath("warehouse"));
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, &warehouse);
    service.ingest({makeSnapshot(1, {{"a", "1"}}), makeSnapshot(2, {{"a", "1"}, {"b", "2"}})});

    const auto report = service.report(2);
    QCOMPARE(report.warehouseStatus.state, buildtrace::WarehouseInsertState::Succeeded);

    const auto rows = warehouse.listRecords();
    QCOMPARE(rows.size(), static_cast<size_t>(1));
    QCOMPARE(rows.front().jobId, static_cast<int64_t>(2));
    QCOMPARE(rows.front().totalAdded, static_cast<int64_t>(1));
    QCOMPARE(rows.front().totalUnchanged, static_cast<int64_t>(1));
}

void ReportServiceTests::testWarehouseFailureKeepsReport()
{
    FailingSink warehouse;
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, &warehouse);
    service.ingest({makeSnapshot(1, {{"a", "1"}}), makeSnapshot(2, {{"b", "1"}})});

    const auto report = service.report(2);
    QCOMPARE(report.warehouseStatus.state, buildtrace::WarehouseInsertState::Failed);
    QCOMPARE(report.moved.size(), static_cast<size_t>(1));
    QCOMPARE(report.metrics.totalAdded, static_cast<int64_t>(1));
}

void ReportServiceTests::testDecrementGapFails()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, nullptr);
    service.ingest({makeSnapshot(1, {{"a", "1"}}), makeSnapshot(3, {{"a", "2"}})});

    QVERIFY_THROWS_EXCEPTION(buildtrace::NotFoundError, service.report(3));
}

void ReportServiceTests::testLatestStoredBridgesGap()
{
    const buildtrace::LatestStoredPredecessorResolver resolver(*m_store);
    buildtrace::ReportService service(*m_store, resolver, nullptr);
    service.ingest({makeSnapshot(1, {{"a", "1"}}), makeSnapshot(3, {{"a", "2"}})});

    const auto report = service.report(3);
    QCOMPARE(*report.previousJobId, static_cast<int64_t>(1));
    QCOMPARE(report.metrics.totalModified, static_cast<int64_t>(1));
}

void ReportServiceTests::testUnknownJob()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    const buildtrace::ReportService service(*m_store, resolver, nullptr);
    QVERIFY_THROWS_EXCEPTION(buildtrace::NotFoundError, service.report(77));
}

void ReportServiceTests::testNonPositiveJob()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    const buildtrace::ReportService service(*m_store, resolver, nullptr);
    QVERIFY_THROWS_EXCEPTION(buildtrace::InvalidRequestError, service.report(0));
    QVERIFY_THROWS_EXCEPTION(buildtrace::InvalidRequestError, service.report(-5));
}

void ReportServiceTests::testIngestValidatesWholeBatch()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, nullptr);

    auto bad = makeSnapshot(2, {{"a", "1"}});
    bad.latencyMs = -3;
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             service.ingest({makeSnapshot(1, {{"a", "1"}}), bad}));
    QVERIFY(m_store->listSnapshots().empty());
}

void ReportServiceTests::testDiffJobs()
{
    const buildtrace::DecrementPredecessorResolver resolver;
    buildtrace::ReportService service(*m_store, resolver, nullptr);
    service.ingest({makeSnapshot(1, {{"a", "1"}}), makeSnapshot(5, {{"a", "1"}, {"z", "9"}})});

    const auto changeSet = service.diffJobs(1, 5);
    QCOMPARE(changeSet.previousJobId, static_cast<int64_t>(1));
    QCOMPARE(changeSet.currentJobId, static_cast<int64_t>(5));
    QCOMPARE(changeSet.added.size(), static_cast<size_t>(1));
    QCOMPARE(changeSet.unchanged.size(), static_cast<size_t>(1));
    QVERIFY_THROWS_EXCEPTION(buildtrace::NotFoundError, service.diffJobs(1, 2));
}

void ReportServiceTests::testPredecessorStoreFailurePropagates()
{
    // A failing read of the predecessor must not fall back to an empty baseline.
    FlakyStore store(makeSnapshot(5, {{"a", "1"}}));
    CountingSink sink;

    const buildtrace::DecrementPredecessorResolver decrement;
    const buildtrace::ReportService byDecrement(store, decrement, &sink);
    QVERIFY_THROWS_EXCEPTION(buildtrace::StoreUnavailableError, byDecrement.report(5));

    const buildtrace::LatestStoredPredecessorResolver latest(store);
    const buildtrace::ReportService byLatest(store, latest, &sink);
    QVERIFY_THROWS_EXCEPTION(buildtrace::StoreUnavailableError, byLatest.report(5));

    QCOMPARE(sink.inserts, 0);
}

QTEST_MAIN(ReportServiceTests)
#include "test_report_service.moc"
