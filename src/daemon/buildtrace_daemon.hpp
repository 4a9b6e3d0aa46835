#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"

namespace buildtrace {

class BuildTraceApiServer;
class PredecessorResolver;
class ReportService;
class SqliteSnapshotStore;
class SqliteWarehouseSink;

/**
 * BuildTraceDaemon wires the snapshot store, the warehouse sink, the
 * predecessor strategy and the report service behind the local API server.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class BuildTraceDaemon : public QObject
{
    Q_OBJECT
public:
    explicit BuildTraceDaemon(ServiceConfig config, QObject *parent = nullptr);
    ~BuildTraceDaemon() override;

    // Opens the stores and starts listening. Returns false if the socket
    // could not be bound.
    bool start();

private:
    ServiceConfig m_config;
    std::unique_ptr<SqliteSnapshotStore> m_store;
    std::unique_ptr<SqliteWarehouseSink> m_warehouse;
    std::unique_ptr<PredecessorResolver> m_resolver;
    std::unique_ptr<ReportService> m_service;
    std::unique_ptr<BuildTraceApiServer> m_apiServer;
};

} // namespace buildtrace
