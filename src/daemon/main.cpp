#include <QCoreApplication>

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/buildtrace_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("buildtrace-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(BUILDTRACE_VERSION));

    buildtrace::logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("buildtrace-daemon");
    logOptions.traceEnabled = qEnvironmentVariableIntValue("BUILDTRACE_TRACE") == 1
        || QCoreApplication::arguments().contains(QStringLiteral("--trace"));
    buildtrace::logging::initLogging(logOptions);
    BTLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("service_config"),
               buildtrace::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    try {
        // The daemon lives for the lifetime of the process.
        buildtrace::BuildTraceDaemon daemon(buildtrace::loadServiceConfig());
        if (!daemon.start()) {
            std::cerr << "BuildTrace: failed to start API server." << std::endl;
            return 1;
        }
        return app.exec();
    } catch (const buildtrace::BuildTraceError &ex) {
        BTLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QStringLiteral("startup"),
                    QStringLiteral("service_config"),
                    buildtrace::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        std::cerr << "BuildTrace: " << ex.what() << std::endl;
        return 1;
    }
}
