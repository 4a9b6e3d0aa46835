#include <QCoreApplication>
#include <QStringList>

#include <iostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "report/ReportCli.hpp"

namespace {

// Strips the logging flags (--trace, --log-level LEVEL) that apply to every
// command. Returns false on an unknown level.
bool takeLoggingFlags(QStringList &args, buildtrace::logging::LogOptions &options)
{
    QStringList remaining;
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            options.traceEnabled = true;
            continue;
        }
        if (arg == QStringLiteral("--log-level") && i + 1 < args.size()) {
            const auto level = buildtrace::logging::parseLogLevel(args.at(++i));
            if (!level.has_value()) {
                return false;
            }
            options.minLevel = *level;
            continue;
        }
        remaining.push_back(arg);
    }
    args = remaining;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("buildtrace-report"));
    QCoreApplication::setApplicationVersion(QStringLiteral(BUILDTRACE_VERSION));

    QStringList args = QCoreApplication::arguments();
    buildtrace::logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("buildtrace-report");
    logOptions.traceEnabled = qEnvironmentVariableIntValue("BUILDTRACE_TRACE") == 1;
    if (!takeLoggingFlags(args, logOptions)) {
        std::cerr << "Unknown --log-level. Use debug, info, warn or error." << std::endl;
        return 1;
    }
    buildtrace::logging::initLogging(logOptions);

    std::vector<QByteArray> localArgs;
    localArgs.reserve(static_cast<size_t>(args.size()));
    for (const QString &arg : args) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    std::vector<char *> rawArgs;
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    buildtrace::ReportCli cli;
    const int code = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
    BTLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("report_cli_exit"),
                QStringLiteral("user_invocation"),
                QStringLiteral("cli"),
                buildtrace::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"exitCode", code}}));
    return code;
}
