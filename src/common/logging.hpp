#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace buildtrace::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    QString processName;
    // Debug events go to the main log and to <process>-trace.log.
    bool traceEnabled = false;
    // Events below this level are dropped (trace mode still keeps Debug).
    LogLevel minLevel = LogLevel::Info;
    // Empty means logsDirPath().
    QString logsDir;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    // Rotated generations kept as <file>.1 .. <file>.N.
    int keepFiles = 3;
};

// Call early in main(). Reads BUILDTRACE_LOG_LEVEL when minLevel is left at
// its default.
void initLogging(const LogOptions &options);
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// $BUILDTRACE_DATA_DIR/logs, else $HOME/.local/share/buildtrace/logs.
QString logsDirPath();

// "debug", "info", "warn"/"warning", "error"; case-insensitive.
std::optional<LogLevel> parseLogLevel(const QString &text);
QString levelName(LogLevel level);

// Thread-local id shared by every line logged while serving one request.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace buildtrace::logging

#define BTLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::buildtrace::logging::logEvent(::buildtrace::logging::LogLevel::Debug, \
                                    ::buildtrace::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BTLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::buildtrace::logging::logEvent(::buildtrace::logging::LogLevel::Info, \
                                    ::buildtrace::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BTLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::buildtrace::logging::logEvent(::buildtrace::logging::LogLevel::Warn, \
                                    ::buildtrace::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BTLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::buildtrace::logging::logEvent(::buildtrace::logging::LogLevel::Error, \
                                    ::buildtrace::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
