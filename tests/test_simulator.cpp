#include <QtTest/QtTest>

#include <cctype>
#include <stdexcept>

#include "common/json_utils.hpp"
#include "engine/diff_engine.hpp"
#include "engine/fingerprint_describer.hpp"
#include "sim/job_simulator.hpp"

class SimulatorTests : public QObject
{
    Q_OBJECT
private slots:
    void testSeedDeterminism();
    void testFirstJobLayout();
    void testJobSequence();
    void testChangeVolumes();
    void testRejectsBadBase();
};

void SimulatorTests::testSeedDeterminism()
{
    buildtrace::JobSimulator first(1234, 30);
    buildtrace::JobSimulator second(1234, 30);
    const auto a = first.generate(5);
    const auto b = second.generate(5);
    QVERIFY(a == b);

    buildtrace::JobSimulator other(4321, 30);
    QVERIFY(other.generate(5) != a);
}

void SimulatorTests::testFirstJobLayout()
{
    buildtrace::JobSimulator simulator(1, 12);
    const auto jobs = simulator.generate(1);
    QCOMPARE(jobs.size(), static_cast<size_t>(1));

    const auto &job = jobs.front();
    QCOMPARE(job.jobId, static_cast<int64_t>(1));
    QCOMPARE(job.objects.size(), static_cast<size_t>(12));
    QCOMPARE(QString::fromStdString(buildtrace::toIso8601Utc(job.timestamp)),
             QStringLiteral("2024-01-01T00:00:00Z"));
    QVERIFY(job.latencyMs >= 1000 && job.latencyMs <= 30000);

    for (const auto &[key, fingerprint] : job.objects) {
        QCOMPARE(key.size(), static_cast<size_t>(4));
        const auto parsed = buildtrace::parseStructuralFingerprint(fingerprint);
        QVERIFY(parsed.has_value());
        QCOMPARE(static_cast<char>(std::toupper(static_cast<unsigned char>(parsed->type.front()))),
                 key.front());
        QVERIFY(parsed->width >= 1 && parsed->width <= 10);
    }
}

void SimulatorTests::testJobSequence()
{
    buildtrace::JobSimulator simulator(99);
    const auto jobs = simulator.generate(4);
    QCOMPARE(jobs.size(), static_cast<size_t>(4));
    for (size_t i = 0; i < jobs.size(); ++i) {
        QCOMPARE(jobs[i].jobId, static_cast<int64_t>(i + 1));
        buildtrace::validateSnapshot(jobs[i]);
    }
    QCOMPARE(QString::fromStdString(buildtrace::toIso8601Utc(jobs[3].timestamp)),
             QStringLiteral("2024-01-01T00:03:00Z"));
}

void SimulatorTests::testChangeVolumes()
{
    buildtrace::JobSimulator simulator(5, 50);
    const auto jobs = simulator.generate(2);
    const auto changeSet = buildtrace::diffSnapshots(jobs[0], jobs[1]);

    // 2-5 fresh ids per job; 5-10% of 50 removed.
    QVERIFY(changeSet.added.size() >= 2 && changeSet.added.size() <= 5);
    QVERIFY(changeSet.removed.size() >= 2 && changeSet.removed.size() <= 5);
    for (const auto &key : changeSet.added) {
        QVERIFY(key.rfind("J2N", 0) == 0);
    }
    QVERIFY(changeSet.modified.size() <= 9);
}

void SimulatorTests::testRejectsBadBase()
{
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, (void)buildtrace::JobSimulator(1, 0));
}

QTEST_MAIN(SimulatorTests)
#include "test_simulator.moc"
