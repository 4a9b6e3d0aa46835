#include "common/config.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace buildtrace {

namespace {

bool parseFlag(const std::string &name, const QString &value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("1") || lowered == QStringLiteral("true")
        || lowered == QStringLiteral("yes") || lowered == QStringLiteral("on")) {
        return true;
    }
    if (lowered == QStringLiteral("0") || lowered == QStringLiteral("false")
        || lowered == QStringLiteral("no") || lowered == QStringLiteral("off")) {
        return false;
    }
    throw ConfigError(name + " must be a boolean, got '" + value.toStdString() + "'");
}

void validatePredecessorStrategy(const std::string &value)
{
    if (value != "decrement" && value != "latest_stored") {
        throw ConfigError("unknown predecessor strategy '" + value
                          + "' (expected decrement or latest_stored)");
    }
}

void applyConfigFile(ServiceConfig &config, const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot read config file " + path.toStdString());
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ConfigError("config file " + path.toStdString() + " is not a JSON object");
    }

    try {
        config.snapshotDbPath = parsed.value("snapshot_db", config.snapshotDbPath);
        config.warehouseDbPath = parsed.value("warehouse_db", config.warehouseDbPath);
        config.warehouseEnabled = parsed.value("warehouse_enabled", config.warehouseEnabled);
        config.predecessorStrategy = parsed.value("predecessor", config.predecessorStrategy);
        config.socketName = parsed.value("socket_name", config.socketName);
    } catch (const nlohmann::json::type_error &ex) {
        throw ConfigError("config file " + path.toStdString() + ": " + ex.what());
    }
}

} // namespace

std::string defaultDataDir()
{
    const QString dataDir = qEnvironmentVariable("BUILDTRACE_DATA_DIR");
    if (!dataDir.isEmpty()) {
        return dataDir.toStdString();
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/buildtrace";
    }
    return (home + QStringLiteral("/.local/share/buildtrace")).toStdString();
}

ServiceConfig loadServiceConfig()
{
    ServiceConfig config;
    config.dataDir = defaultDataDir();
    config.snapshotDbPath = config.dataDir + "/snapshots.db";
    config.warehouseDbPath = config.dataDir + "/warehouse.db";

    applyConfigFile(config, QString::fromStdString(config.dataDir + "/config.json"));

    if (qEnvironmentVariableIsSet("BUILDTRACE_SNAPSHOT_DB")) {
        config.snapshotDbPath = qEnvironmentVariable("BUILDTRACE_SNAPSHOT_DB").toStdString();
    }
    if (qEnvironmentVariableIsSet("BUILDTRACE_WAREHOUSE_DB")) {
        config.warehouseDbPath = qEnvironmentVariable("BUILDTRACE_WAREHOUSE_DB").toStdString();
    }
    if (qEnvironmentVariableIsSet("BUILDTRACE_WAREHOUSE_ENABLED")) {
        config.warehouseEnabled = parseFlag("BUILDTRACE_WAREHOUSE_ENABLED",
                                            qEnvironmentVariable("BUILDTRACE_WAREHOUSE_ENABLED"));
    }
    if (qEnvironmentVariableIsSet("BUILDTRACE_PREDECESSOR")) {
        config.predecessorStrategy = qEnvironmentVariable("BUILDTRACE_PREDECESSOR").toStdString();
    }
    if (qEnvironmentVariableIsSet("BUILDTRACE_SOCKET_NAME")) {
        config.socketName = qEnvironmentVariable("BUILDTRACE_SOCKET_NAME").toStdString();
    }

    validatePredecessorStrategy(config.predecessorStrategy);
    if (config.snapshotDbPath.empty()) {
        throw ConfigError("snapshot database path must not be empty");
    }
    if (config.warehouseEnabled && config.warehouseDbPath.empty()) {
        throw ConfigError("warehouse database path must not be empty");
    }

    BTLOG_DEBUG(QStringLiteral("Config"),
                QStringLiteral("loadServiceConfig"),
                QStringLiteral("config_loaded"),
                QStringLiteral("startup"),
                QStringLiteral("env_and_file"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"dataDir", config.dataDir},
                                {"snapshotDb", config.snapshotDbPath},
                                {"warehouseDb", config.warehouseDbPath},
                                {"warehouseEnabled", config.warehouseEnabled},
                                {"predecessor", config.predecessorStrategy}}));
    return config;
}

} // namespace buildtrace
