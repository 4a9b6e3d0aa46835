#include "daemon/buildtrace_daemon.hpp"

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/buildtrace_api_server.hpp"
#include "engine/predecessor.hpp"
#include "service/report_service.hpp"
#include "store/sqlite_snapshot_store.hpp"
#include "store/sqlite_warehouse_sink.hpp"

namespace buildtrace {

BuildTraceDaemon::BuildTraceDaemon(ServiceConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
}

BuildTraceDaemon::~BuildTraceDaemon() = default;

bool BuildTraceDaemon::start()
{
    qInfo() << "BuildTrace: daemon starting (version" << BUILDTRACE_VERSION << ")";

    m_store = std::make_unique<SqliteSnapshotStore>(m_config.snapshotDbPath);
    if (m_config.warehouseEnabled) {
        m_warehouse = std::make_unique<SqliteWarehouseSink>(m_config.warehouseDbPath);
    }
    m_resolver = makePredecessorResolver(m_config.predecessorStrategy, *m_store);
    m_service = std::make_unique<ReportService>(*m_store, *m_resolver, m_warehouse.get());
    m_apiServer = std::make_unique<BuildTraceApiServer>(
        *m_service, *m_store, QString::fromStdString(m_config.socketName));

    BTLOG_INFO(QStringLiteral("BuildTraceDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_components_ready"),
               QStringLiteral("daemon_start"),
               QStringLiteral("service_config"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"snapshotDb", m_config.snapshotDbPath},
                               {"warehouseEnabled", m_config.warehouseEnabled},
                               {"predecessor", m_resolver->name()}}));

    return m_apiServer->start();
}

} // namespace buildtrace
