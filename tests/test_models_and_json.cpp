#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testIsoTimestamps();
    void testParseJobSubmission();
    void testParseJobSubmissionErrors();
    void testStrictJsonRejectsDuplicateKeys();
    void testStrictJsonAllowsSameKeyInSiblings();
    void testSnapshotJsonRoundTrip();
    void testMetricsRecordFieldNames();
    void testChangeReportJson();
    void testWarehouseStatusJson();
};

void ModelsJsonTests::testIsoTimestamps()
{
    const auto parsed = *buildtrace::fromIso8601Utc("2024-02-29T23:59:58Z");
    QCOMPARE(QString::fromStdString(buildtrace::toIso8601Utc(parsed)),
             QStringLiteral("2024-02-29T23:59:58Z"));
    QVERIFY(!buildtrace::fromIso8601Utc("yesterday").has_value());
    QVERIFY(!buildtrace::fromIso8601Utc("2024-01-01T00:00:00Zjunk").has_value());

    const auto epoch = buildtrace::fromIso8601Utc("1970-01-01T00:00:00Z");
    QVERIFY(epoch.has_value());
    QVERIFY(*epoch == std::chrono::system_clock::time_point{});
    const auto beforeEpoch = buildtrace::fromIso8601Utc("1969-12-31T23:59:59Z");
    QVERIFY(beforeEpoch.has_value());
    QVERIFY(*beforeEpoch == std::chrono::system_clock::time_point{} - std::chrono::seconds(1));
}

void ModelsJsonTests::testParseJobSubmission()
{
    const auto j = buildtrace::parseStrictJson(
        R"({"job_id": 42, "timestamp": "2024-01-01T00:41:00Z", "latency_ms": 15000,
            "state": {"W001": "wall_10_10_5_5", "D002": "door_1_1_1_2"}})");
    const auto snapshot = buildtrace::parseJobSubmission(j);

    QCOMPARE(snapshot.jobId, static_cast<int64_t>(42));
    QCOMPARE(snapshot.latencyMs, static_cast<int64_t>(15000));
    QCOMPARE(snapshot.objects.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(snapshot.objects.at("W001")), QStringLiteral("wall_10_10_5_5"));
    QCOMPARE(QString::fromStdString(buildtrace::toIso8601Utc(snapshot.timestamp)),
             QStringLiteral("2024-01-01T00:41:00Z"));

    const auto batch = buildtrace::parseJobSubmissions(nlohmann::json::array({j, j}));
    QCOMPARE(batch.size(), static_cast<size_t>(2));
}

void ModelsJsonTests::testParseJobSubmissionErrors()
{
    const nlohmann::json valid = {
        {"job_id", 1}, {"timestamp", "2024-01-01T00:00:00Z"}, {"latency_ms", 10}, {"state", nlohmann::json::object()}
    };
    buildtrace::parseJobSubmission(valid);

    auto stringId = valid;
    stringId["job_id"] = "1";
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError, buildtrace::parseJobSubmission(stringId));

    auto badTimestamp = valid;
    badTimestamp["timestamp"] = "01/01/2024";
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError, buildtrace::parseJobSubmission(badTimestamp));

    auto epochTimestamp = valid;
    epochTimestamp["timestamp"] = "1970-01-01T00:00:00Z";
    const auto epochJob = buildtrace::parseJobSubmission(epochTimestamp);
    QCOMPARE(QString::fromStdString(buildtrace::toIso8601Utc(epochJob.timestamp)),
             QStringLiteral("1970-01-01T00:00:00Z"));

    auto noState = valid;
    noState.erase("state");
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError, buildtrace::parseJobSubmission(noState));

    auto numericFingerprint = valid;
    numericFingerprint["state"] = {{"a", 3}};
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             buildtrace::parseJobSubmission(numericFingerprint));

    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             buildtrace::parseJobSubmissions(valid));
}

void ModelsJsonTests::testStrictJsonRejectsDuplicateKeys()
{
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             buildtrace::parseStrictJson(R"({"state": {"a": "1", "a": "2"}})"));
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             buildtrace::parseStrictJson(R"({"a": 1, "b": 2, "a": 3})"));
    QVERIFY_THROWS_EXCEPTION(buildtrace::MalformedSnapshotError,
                             buildtrace::parseStrictJson("[1, 2"));
}

void ModelsJsonTests::testStrictJsonAllowsSameKeyInSiblings()
{
    const auto parsed = buildtrace::parseStrictJson(
        R"([{"job_id": 1, "state": {"a": "x"}}, {"job_id": 2, "state": {"a": "y"}}])");
    QCOMPARE(parsed.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(parsed[1]["state"]["a"].get<std::string>()), QStringLiteral("y"));
}

void ModelsJsonTests::testSnapshotJsonRoundTrip()
{
    buildtrace::JobSnapshot snapshot;
    snapshot.jobId = 9;
    snapshot.timestamp = *buildtrace::fromIso8601Utc("2024-01-01T00:08:00Z");
    snapshot.latencyMs = 321;
    snapshot.objects = {{"k1", "v1"}, {"k2", "v2"}};

    const nlohmann::json j = snapshot;
    QCOMPARE(QString::fromStdString(j["timestamp"].get<std::string>()),
             QStringLiteral("2024-01-01T00:08:00Z"));
    const auto parsed = j.get<buildtrace::JobSnapshot>();
    QVERIFY(parsed == snapshot);
}

void ModelsJsonTests::testMetricsRecordFieldNames()
{
    buildtrace::MetricsRecord record;
    record.timestamp = *buildtrace::fromIso8601Utc("2024-01-01T00:00:00Z");
    record.jobId = 17;
    record.latencyMs = 800;
    record.totalAdded = 1;
    record.totalRemoved = 2;
    record.totalModified = 3;
    record.totalUnchanged = 4;

    const nlohmann::json j = record;
    QCOMPARE(QString::fromStdString(j["job_id"].get<std::string>()), QStringLiteral("17"));
    QCOMPARE(j["latency_ms"].get<int64_t>(), static_cast<int64_t>(800));
    QCOMPARE(j["total_added"].get<int64_t>(), static_cast<int64_t>(1));
    QCOMPARE(j["total_removed"].get<int64_t>(), static_cast<int64_t>(2));
    QCOMPARE(j["total_modified"].get<int64_t>(), static_cast<int64_t>(3));
    QCOMPARE(j["total_unchanged"].get<int64_t>(), static_cast<int64_t>(4));
}

void ModelsJsonTests::testChangeReportJson()
{
    buildtrace::ChangeReport report;
    report.jobId = 3;
    report.added = {{"n", "n added"}};
    report.moved = {{"a", "b", "fp", "a renamed to b"}};
    report.summary = "1 item(s) added.";

    const nlohmann::json j = report;
    QVERIFY(j["previous_job_id"].is_null());
    QCOMPARE(QString::fromStdString(j["moved"][0]["from"].get<std::string>()), QStringLiteral("a"));
    QCOMPARE(QString::fromStdString(j["moved"][0]["to"].get<std::string>()), QStringLiteral("b"));
    QCOMPARE(QString::fromStdString(j["added"][0]["description"].get<std::string>()),
             QStringLiteral("n added"));

    report.previousJobId = 2;
    const nlohmann::json withPrevious = report;
    QCOMPARE(withPrevious["previous_job_id"].get<int64_t>(), static_cast<int64_t>(2));
}

void ModelsJsonTests::testWarehouseStatusJson()
{
    buildtrace::WarehouseStatus status;
    status.state = buildtrace::WarehouseInsertState::Failed;
    status.message = "disk full";

    const nlohmann::json j = status;
    QCOMPARE(QString::fromStdString(j["state"].get<std::string>()), QStringLiteral("failed"));
    QVERIFY(j["attempted"].get<bool>());
    QVERIFY(!j["succeeded"].get<bool>());
    QCOMPARE(QString::fromStdString(j["text"].get<std::string>()),
             QStringLiteral("attempted, failed: disk full"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
