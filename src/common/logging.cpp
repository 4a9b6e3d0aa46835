#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace buildtrace::logging {

namespace {

struct LoggerState {
    std::mutex mutex;
    LogOptions options;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_corrId;

int severity(LogLevel level)
{
    return static_cast<int>(level);
}

// Shifts <path>.N-1 -> <path>.N down to <path> -> <path>.1 once the file is full.
void rotate(const QString &path, qint64 maxBytes, int keepFiles)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < maxBytes) {
        return;
    }
    if (keepFiles <= 0) {
        QFile::remove(path);
        return;
    }

    QFile::remove(QStringLiteral("%1.%2").arg(path).arg(keepFiles));
    for (int generation = keepFiles - 1; generation >= 1; --generation) {
        const QString from = QStringLiteral("%1.%2").arg(path).arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, QStringLiteral("%1.%2").arg(path).arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(const LogOptions &options, const QString &path, const QByteArray &line)
{
    rotate(path, options.maxFileBytes, options.keepFiles);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Losing the log file must not lose the event.
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

QString resolvedLogsDir(const LogOptions &options)
{
    return options.logsDir.isEmpty() ? logsDirPath() : options.logsDir;
}

} // namespace

QString logsDirPath()
{
    const QString dataDir = qEnvironmentVariable("BUILDTRACE_DATA_DIR");
    if (!dataDir.isEmpty()) {
        return dataDir + QStringLiteral("/logs");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/buildtrace/logs");
    }
    return home + QStringLiteral("/.local/share/buildtrace/logs");
}

std::optional<LogLevel> parseLogLevel(const QString &text)
{
    const QString lowered = text.trimmed().toLower();
    if (lowered == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (lowered == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (lowered == QStringLiteral("warn") || lowered == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void initLogging(const LogOptions &options)
{
    LogOptions resolved = options;
    if (resolved.minLevel == LogLevel::Info && qEnvironmentVariableIsSet("BUILDTRACE_LOG_LEVEL")) {
        const QString requested = qEnvironmentVariable("BUILDTRACE_LOG_LEVEL");
        const auto parsed = parseLogLevel(requested);
        if (parsed.has_value()) {
            resolved.minLevel = *parsed;
        } else {
            fprintf(stderr, "buildtrace: ignoring unknown BUILDTRACE_LOG_LEVEL '%s'\n",
                    requested.toUtf8().constData());
        }
    }

    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.options = resolved;
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LogOptions options;
    options.processName = processName;
    options.traceEnabled = traceEnabled;
    initLogging(options);
}

bool isTraceEnabled()
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    return logger.options.traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LoggerState &logger = state();
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (!logger.options.processName.isEmpty()) {
            return logger.options.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("buildtrace");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2,pid:%3")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()))
        .arg(static_cast<qint64>(getpid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    const LogOptions &options = logger.options;

    const bool toMain = severity(level) >= severity(options.minLevel)
        || (level == LogLevel::Debug && options.traceEnabled);
    if (!toMain && !options.traceEnabled) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? t_corrId : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Object keys and fingerprints may carry arbitrary bytes.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = resolvedLogsDir(options);
    QDir().mkpath(dir);
    const QString base = dir + QLatin1Char('/')
        + (processName.isEmpty() ? QStringLiteral("buildtrace") : processName);

    if (toMain) {
        appendLine(options, base + QStringLiteral(".log"), line);
    }
    if (options.traceEnabled) {
        appendLine(options, base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace buildtrace::logging
