#include "daemon/buildtrace_api_server.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QUuid>

#include <unistd.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "service/report_service.hpp"
#include "store/snapshot_store.hpp"

namespace buildtrace {

namespace {

QString runtimeSocketPath(const QString &configured)
{
    if (!configured.isEmpty()) {
        return configured;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/buildtrace.sock");
}

int64_t requireJobId(const nlohmann::json &params)
{
    if (!params.contains("job_id")) {
        throw InvalidRequestError("Missing job_id");
    }
    const auto &value = params.at("job_id");
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    // Path-style callers send the id as a string.
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char *end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (!text.empty() && end && *end == '\0' && errno == 0) {
            return parsed;
        }
    }
    throw InvalidRequestError("job_id must be an integer");
}

} // namespace

BuildTraceApiServer::BuildTraceApiServer(ReportService &service,
                                         SnapshotStore &store,
                                         QString socketName,
                                         QObject *parent)
    : QObject(parent)
    , m_service(service)
    , m_store(store)
    , m_socketName(std::move(socketName))
{
}

BuildTraceApiServer::~BuildTraceApiServer() = default;

QString BuildTraceApiServer::socketPath() const
{
    return runtimeSocketPath(m_socketName);
}

bool BuildTraceApiServer::start()
{
    const QString path = socketPath();
    if (path.contains('/')) {
        const QFileInfo socketInfo(path);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(path)) {
            if (!QLocalServer::removeServer(path)) {
                qWarning() << "Failed to remove existing BuildTrace socket" << path;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(path);
    }

    if (!m_server.listen(path)) {
        qWarning() << "Failed to listen on BuildTrace socket" << path
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &BuildTraceApiServer::handleNewConnection);

    BTLOG_INFO(QStringLiteral("BuildTraceApiServer"),
               QStringLiteral("start"),
               QStringLiteral("api_server_listening"),
               QStringLiteral("daemon_start"),
               QStringLiteral("local_socket"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"socket", path.toStdString()}}));
    return true;
}

void BuildTraceApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &BuildTraceApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            m_pending.remove(socket);
        });
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void BuildTraceApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    QByteArray &buffer = m_pending[socket];
    buffer.append(socket->readAll());
    if (buffer.trimmed().isEmpty()) {
        return;
    }

    QByteArray reply;
    if (buffer.size() > kMaxRequestBytes) {
        BTLOG_WARN(QStringLiteral("BuildTraceApiServer"),
                   QStringLiteral("handleClientReadyRead"),
                   QStringLiteral("api_request_too_large"),
                   QStringLiteral("client_call"),
                   QStringLiteral("local_socket"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"bytes", buffer.size()}}));
        reply = makeErrorResponse(QStringLiteral("Request too large"),
                                  QStringLiteral("invalid_request"));
    } else if (isRequestComplete(buffer)) {
        reply = handleRequestPayload(buffer);
    } else {
        // Wait for the rest of the document.
        return;
    }

    m_pending.remove(socket);
    socket->write(reply);
    socket->flush();
    socket->disconnectFromServer();
}

bool BuildTraceApiServer::isRequestComplete(const QByteArray &buffer)
{
    try {
        (void)nlohmann::json::parse(buffer.constBegin(), buffer.constEnd());
        return true;
    } catch (const nlohmann::json::parse_error &ex) {
        // The lexer reports one past the last byte when it ran out of input.
        return ex.byte <= static_cast<std::size_t>(buffer.size());
    }
}

QByteArray BuildTraceApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    nlohmann::json parsed;
    try {
        // Strict parsing: a job state with a repeated object key is rejected here.
        parsed = parseStrictJson(payload.toStdString());
    } catch (const MalformedSnapshotError &ex) {
        BTLOG_WARN(QStringLiteral("BuildTraceApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), QStringLiteral("invalid_request"));
    }
    if (!parsed.is_object()) {
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"),
                                 QStringLiteral("invalid_request"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        BTLOG_WARN(QStringLiteral("BuildTraceApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"),
                                 QStringLiteral("invalid_request"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"),
                                     QStringLiteral("invalid_request"), id);
        }
        params = parsed["params"];
    }

    BTLOG_INFO(QStringLiteral("BuildTraceApiServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}}));

    const auto start = std::chrono::steady_clock::now();
    QString code;
    QString message;
    try {
        const nlohmann::json result = dispatch(method, params);
        BTLOG_INFO(QStringLiteral("BuildTraceApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                  {"durationMs",
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const InvalidRequestError &ex) {
        code = QStringLiteral("invalid_request");
        message = QString::fromUtf8(ex.what());
    } catch (const MalformedSnapshotError &ex) {
        code = QStringLiteral("invalid_request");
        message = QString::fromUtf8(ex.what());
    } catch (const NotFoundError &ex) {
        code = QStringLiteral("not_found");
        message = QString::fromUtf8(ex.what());
    } catch (const SnapshotConflictError &ex) {
        code = QStringLiteral("conflict");
        message = QString::fromUtf8(ex.what());
    } catch (const StoreUnavailableError &ex) {
        code = QStringLiteral("store_unavailable");
        message = QString::fromUtf8(ex.what());
    } catch (const std::exception &ex) {
        code = QStringLiteral("internal");
        message = QStringLiteral("Internal analysis failed: %1").arg(QString::fromUtf8(ex.what()));
    }

    BTLOG_ERROR(QStringLiteral("BuildTraceApiServer"),
                QStringLiteral("handleRequest"),
                QStringLiteral("api_request_error"),
                code,
                QStringLiteral("json_rpc"),
                logging::defaultWho(),
                corrId,
                (nlohmann::json{{"method", method}, {"what", message.toStdString()}}));
    return makeErrorResponse(message, code, id);
}

nlohmann::json BuildTraceApiServer::dispatch(const std::string &method,
                                             const nlohmann::json &params)
{
    if (method == "process_jobs") {
        if (!params.contains("jobs")) {
            throw InvalidRequestError("Missing jobs array");
        }
        const auto snapshots = parseJobSubmissions(params.at("jobs"));
        const size_t accepted = m_service.ingest(snapshots);
        return nlohmann::json{
            {"status", "Jobs accepted and state stored. Ready for reporting."},
            {"accepted", accepted}
        };
    }

    if (method == "get_report") {
        const int64_t jobId = requireJobId(params);
        nlohmann::json result;
        result["report"] = m_service.report(jobId);
        return result;
    }

    if (method == "health") {
        // Reading the store surfaces StoreUnavailableError as an unhealthy reply.
        const auto snapshots = m_store.listSnapshots();
        return nlohmann::json{
            {"status", "SUCCESS"},
            {"service", "buildtrace"},
            {"version", BUILDTRACE_VERSION},
            {"storedJobs", snapshots.size()}
        };
    }

    throw InvalidRequestError("Unknown method: " + method);
}

QByteArray BuildTraceApiServer::makeErrorResponse(const QString &message,
                                                  const QString &code,
                                                  int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["code"] = code.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray BuildTraceApiServer::makeResultResponse(const nlohmann::json &result,
                                                   int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace buildtrace
