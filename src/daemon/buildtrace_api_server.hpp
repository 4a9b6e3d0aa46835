#pragma once

#include <QHash>
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

namespace buildtrace {

class ReportService;
class SnapshotStore;

/**
 * BuildTraceApiServer exposes ingestion and change reports over a local
 * socket using a minimal JSON-RPC-like protocol:
 *
 *   {"id": 1, "method": "get_report", "params": {"job_id": 42}}
 *   -> {"id": 1, "result": {"report": {...}}}
 *   -> {"id": 1, "error": "...", "code": "not_found"}
 */
class BuildTraceApiServer : public QObject
{
    Q_OBJECT
public:
    BuildTraceApiServer(ReportService &service,
                        SnapshotStore &store,
                        QString socketName,
                        QObject *parent = nullptr);
    ~BuildTraceApiServer() override;

    // Start listening on the configured socket, or $XDG_RUNTIME_DIR/buildtrace.sock.
    bool start();
    QString socketPath() const;

    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

    // A request may arrive over several reads. Returns false while the buffer
    // is a truncated JSON document; true once it parses or fails before its end.
    static bool isRequestComplete(const QByteArray &buffer);

    static constexpr qsizetype kMaxRequestBytes = 64 * 1024 * 1024;

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);

    QByteArray makeErrorResponse(const QString &message, const QString &code, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    ReportService &m_service;
    SnapshotStore &m_store;
    QString m_socketName;
    QLocalServer m_server;
    QHash<QLocalSocket *, QByteArray> m_pending;
};

} // namespace buildtrace
