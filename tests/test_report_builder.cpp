#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <vector>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "engine/diff_engine.hpp"
#include "engine/report_builder.hpp"
#include "store/warehouse_sink.hpp"

namespace {

class RecordingSink : public buildtrace::WarehouseSink {
public:
    void insert(const buildtrace::MetricsRecord &record) override
    {
        records.push_back(record);
    }

    std::vector<buildtrace::MetricsRecord> records;
};

class FailingSink : public buildtrace::WarehouseSink {
public:
    void insert(const buildtrace::MetricsRecord &) override
    {
        throw buildtrace::WarehouseInsertError("warehouse offline");
    }
};

buildtrace::JobSnapshot makeSnapshot(int64_t jobId, buildtrace::ObjectMap objects)
{
    buildtrace::JobSnapshot snapshot;
    snapshot.jobId = jobId;
    snapshot.timestamp = *buildtrace::fromIso8601Utc("2024-03-01T12:00:00Z")
        + std::chrono::minutes(jobId);
    snapshot.latencyMs = 2500 + jobId;
    snapshot.objects = std::move(objects);
    return snapshot;
}

} // namespace

class ReportBuilderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testMetricsCounts();
    void testMovesListedSeparately();
    void testDescriptions();
    void testSummary();
    void testNoSinkNotAttempted();
    void testSinkReceivesRecord();
    void testSinkFailureIsCaptured();
    void testMetaOnlyBuild();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ReportBuilderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportBuilderTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportBuilderTests::testMetricsCounts()
{
    const auto previous = makeSnapshot(1, {{"A", "h1"}, {"B", "h2"}, {"C", "h3"}});
    const auto current = makeSnapshot(2, {{"A", "h1"}, {"B", "h9"}, {"D", "h4"}});
    const auto changeSet = buildtrace::diffSnapshots(previous, current);

    const auto record = buildtrace::makeMetricsRecord(changeSet, current.meta());
    QCOMPARE(record.jobId, static_cast<int64_t>(2));
    QCOMPARE(record.latencyMs, current.latencyMs);
    QVERIFY(record.timestamp == current.timestamp);
    QCOMPARE(record.totalAdded, static_cast<int64_t>(1));
    QCOMPARE(record.totalRemoved, static_cast<int64_t>(1));
    QCOMPARE(record.totalModified, static_cast<int64_t>(1));
    QCOMPARE(record.totalUnchanged, static_cast<int64_t>(1));
}

void ReportBuilderTests::testMovesListedSeparately()
{
    const auto previous = makeSnapshot(1, {{"W001", "wall_1_1_5_5"}, {"X", "opaque"}});
    const auto current = makeSnapshot(2, {{"W100", "wall_1_1_5_5"}, {"Y", "other"}});
    const auto changeSet = buildtrace::diffSnapshots(previous, current);

    const buildtrace::ReportBuilder builder;
    const auto result = builder.build(changeSet, previous, current);

    // The moved pair still counts as one addition and one removal.
    QCOMPARE(result.metrics.totalAdded, static_cast<int64_t>(2));
    QCOMPARE(result.metrics.totalRemoved, static_cast<int64_t>(2));

    QCOMPARE(result.report.moved.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(result.report.moved.front().fromKey), QStringLiteral("W001"));
    QCOMPARE(QString::fromStdString(result.report.moved.front().toKey), QStringLiteral("W100"));
    QCOMPARE(result.report.added.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(result.report.added.front().key), QStringLiteral("Y"));
    QCOMPARE(result.report.removed.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(result.report.removed.front().key), QStringLiteral("X"));
}

void ReportBuilderTests::testDescriptions()
{
    const auto previous = makeSnapshot(1, {{"D1", "door_10_10_1_2"}});
    const auto current = makeSnapshot(2, {{"D1", "door_12_10_1_2"}, {"S9", "stair_4_5_2_2"}});
    const auto changeSet = buildtrace::diffSnapshots(previous, current);

    const auto result = buildtrace::ReportBuilder().build(changeSet, previous, current);
    QCOMPARE(result.report.modified.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(result.report.modified.front().before),
             QStringLiteral("door_10_10_1_2"));
    QCOMPARE(QString::fromStdString(result.report.modified.front().after),
             QStringLiteral("door_12_10_1_2"));
    QCOMPARE(QString::fromStdString(result.report.modified.front().description),
             QStringLiteral("D1 (door) moved 2 units east"));
    QCOMPARE(QString::fromStdString(result.report.added.front().description),
             QStringLiteral("S9 (stair added at x:4, y:5)"));
    QVERIFY(result.report.previousJobId.has_value());
    QCOMPARE(*result.report.previousJobId, static_cast<int64_t>(1));
}

void ReportBuilderTests::testSummary()
{
    buildtrace::ChangeReport empty;
    QCOMPARE(QString::fromStdString(buildtrace::summarizeReport(empty)),
             QStringLiteral("No significant changes detected."));

    buildtrace::ChangeReport report;
    report.added = {{"a", "a added"}, {"b", "b added"}};
    report.modified = {{"c", "1", "2", "c fingerprint changed"}};
    QCOMPARE(QString::fromStdString(buildtrace::summarizeReport(report)),
             QStringLiteral("2 item(s) added. | 1 item(s) moved/modified."));
}

void ReportBuilderTests::testNoSinkNotAttempted()
{
    const auto previous = makeSnapshot(1, {{"a", "1"}});
    const auto current = makeSnapshot(2, {{"a", "1"}});
    const auto result = buildtrace::ReportBuilder().build(
        buildtrace::diffSnapshots(previous, current), previous, current);

    QCOMPARE(result.report.warehouseStatus.state, buildtrace::WarehouseInsertState::NotAttempted);
    QCOMPARE(QString::fromStdString(buildtrace::describeWarehouseStatus(result.report.warehouseStatus)),
             QStringLiteral("not attempted"));
}

void ReportBuilderTests::testSinkReceivesRecord()
{
    RecordingSink sink;
    const auto previous = makeSnapshot(1, {{"a", "1"}});
    const auto current = makeSnapshot(2, {{"a", "2"}, {"b", "3"}});
    const auto result = buildtrace::ReportBuilder(&sink).build(
        buildtrace::diffSnapshots(previous, current), previous, current);

    QCOMPARE(sink.records.size(), static_cast<size_t>(1));
    QCOMPARE(sink.records.front().jobId, static_cast<int64_t>(2));
    QCOMPARE(sink.records.front().totalAdded, static_cast<int64_t>(1));
    QCOMPARE(sink.records.front().totalModified, static_cast<int64_t>(1));
    QCOMPARE(result.report.warehouseStatus.state, buildtrace::WarehouseInsertState::Succeeded);
}

void ReportBuilderTests::testSinkFailureIsCaptured()
{
    FailingSink sink;
    const auto previous = makeSnapshot(1, {{"a", "1"}, {"b", "2"}});
    const auto current = makeSnapshot(2, {{"a", "1"}, {"c", "4"}});

    const auto result = buildtrace::ReportBuilder(&sink).build(
        buildtrace::diffSnapshots(previous, current), previous, current);

    QCOMPARE(result.report.warehouseStatus.state, buildtrace::WarehouseInsertState::Failed);
    QCOMPARE(QString::fromStdString(result.report.warehouseStatus.message),
             QStringLiteral("warehouse offline"));
    QCOMPARE(QString::fromStdString(buildtrace::describeWarehouseStatus(result.report.warehouseStatus)),
             QStringLiteral("attempted, failed: warehouse offline"));
    QCOMPARE(result.report.metrics.totalAdded, static_cast<int64_t>(1));
    QCOMPARE(result.report.metrics.totalRemoved, static_cast<int64_t>(1));
    QCOMPARE(result.report.metrics.totalUnchanged, static_cast<int64_t>(1));
}

void ReportBuilderTests::testMetaOnlyBuild()
{
    const auto previous = makeSnapshot(3, {{"a", "1"}});
    const auto current = makeSnapshot(4, {{"b", "2"}});
    const auto changeSet = buildtrace::diffSnapshots(previous, current);

    const auto result = buildtrace::ReportBuilder().build(changeSet, previous.meta(), current.meta());
    QCOMPARE(result.report.jobId, static_cast<int64_t>(4));
    QCOMPARE(QString::fromStdString(result.report.added.front().description),
             QStringLiteral("b added"));
    QCOMPARE(QString::fromStdString(result.report.removed.front().description),
             QStringLiteral("a removed"));
}

QTEST_MAIN(ReportBuilderTests)
#include "test_report_builder.moc"
