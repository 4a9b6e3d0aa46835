#pragma once

#include <QString>
#include <QStringList>

namespace buildtrace {

class ReportCli
{
public:
    // CLI dispatcher for ingestion, change reports, raw diffs, metrics and
    // synthetic job generation.
    // returns exit code: 0 ok, 1 usage or input error, 2 not found, 3 storage failure
    int run(int argc, char *argv[]);

private:
    int runIngest(const QStringList &args);
    int runReport(const QStringList &args);
    int runDiff(const QStringList &args);
    int runMetrics(const QStringList &args);
    int runSimulate(const QStringList &args);
};

} // namespace buildtrace
