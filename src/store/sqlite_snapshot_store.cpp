#include "store/sqlite_snapshot_store.hpp"

#include <mutex>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_utils.hpp"

namespace buildtrace {

namespace {

constexpr const char *kCreateSnapshotsTable =
    "CREATE TABLE IF NOT EXISTS snapshots ("
    "    job_id INTEGER PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    latency_ms INTEGER NOT NULL"
    ");";

constexpr const char *kCreateObjectsTable =
    "CREATE TABLE IF NOT EXISTS snapshot_objects ("
    "    job_id INTEGER NOT NULL REFERENCES snapshots(job_id),"
    "    object_key TEXT NOT NULL,"
    "    fingerprint BLOB NOT NULL,"
    "    PRIMARY KEY (job_id, object_key)"
    ");";

std::string jobLabel(int64_t jobId)
{
    return "job " + std::to_string(jobId);
}

} // namespace

struct SqliteSnapshotStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    // Serializes multi-statement operations; SQLite itself runs full-mutex.
    mutable std::mutex mutex;

    std::optional<JobSnapshot> load(int64_t jobId) const;
};

std::optional<JobSnapshot> SqliteSnapshotStore::Impl::load(int64_t jobId) const
{
    sqlite::Statement metaStmt(db,
                               "SELECT timestamp, latency_ms FROM snapshots "
                               "WHERE job_id = ? LIMIT 1;");
    sqlite3_bind_int64(metaStmt.get(), 1, jobId);

    const int rc = sqlite3_step(metaStmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StoreUnavailableError("failed to read " + jobLabel(jobId) + ": "
                                    + sqlite::lastError(db));
    }

    JobSnapshot snapshot;
    snapshot.jobId = jobId;
    snapshot.timestamp = sqlite::fromEpochSeconds(sqlite3_column_int64(metaStmt.get(), 0));
    snapshot.latencyMs = sqlite3_column_int64(metaStmt.get(), 1);

    sqlite::Statement objectsStmt(db,
                                  "SELECT object_key, fingerprint FROM snapshot_objects "
                                  "WHERE job_id = ?;");
    sqlite3_bind_int64(objectsStmt.get(), 1, jobId);

    int step = SQLITE_ROW;
    while ((step = sqlite3_step(objectsStmt.get())) == SQLITE_ROW) {
        snapshot.objects.emplace(sqlite::columnText(objectsStmt.get(), 0),
                                 sqlite::columnBlob(objectsStmt.get(), 1));
    }
    if (step != SQLITE_DONE) {
        throw StoreUnavailableError("failed to read objects of " + jobLabel(jobId) + ": "
                                    + sqlite::lastError(db));
    }
    return snapshot;
}

SqliteSnapshotStore::SqliteSnapshotStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath;
    impl->db = sqlite::openDatabase(dbPath);

    try {
        sqlite::execOrThrow(impl->db, kCreateSnapshotsTable);
        sqlite::execOrThrow(impl->db, kCreateObjectsTable);
    } catch (const StoreUnavailableError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

SqliteSnapshotStore::~SqliteSnapshotStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

JobSnapshot SqliteSnapshotStore::fetch(int64_t jobId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    auto snapshot = impl->load(jobId);
    if (!snapshot.has_value()) {
        throw NotFoundError("no snapshot stored for " + jobLabel(jobId));
    }
    return std::move(*snapshot);
}

void SqliteSnapshotStore::put(const JobSnapshot &snapshot)
{
    std::lock_guard<std::mutex> lock(impl->mutex);

    // INVARIANT: a stored snapshot is immutable.
    if (const auto existing = impl->load(snapshot.jobId)) {
        const bool identical =
            sqlite::toEpochSeconds(existing->timestamp) == sqlite::toEpochSeconds(snapshot.timestamp)
            && existing->latencyMs == snapshot.latencyMs
            && existing->objects == snapshot.objects;
        if (identical) {
            BTLOG_DEBUG(QStringLiteral("SqliteSnapshotStore"),
                        QStringLiteral("put"),
                        QStringLiteral("snapshot_already_stored"),
                        QStringLiteral("idempotent_ingestion"),
                        QStringLiteral("sqlite"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"jobId", snapshot.jobId}}));
            return;
        }
        throw SnapshotConflictError("a different snapshot is already stored for "
                                    + jobLabel(snapshot.jobId));
    }

    sqlite::execOrThrow(impl->db, "BEGIN IMMEDIATE;");
    try {
        sqlite::Statement metaStmt(impl->db,
                                   "INSERT INTO snapshots (job_id, timestamp, latency_ms) "
                                   "VALUES (?, ?, ?);");
        sqlite3_bind_int64(metaStmt.get(), 1, snapshot.jobId);
        sqlite3_bind_int64(metaStmt.get(), 2, sqlite::toEpochSeconds(snapshot.timestamp));
        sqlite3_bind_int64(metaStmt.get(), 3, snapshot.latencyMs);
        if (sqlite3_step(metaStmt.get()) != SQLITE_DONE) {
            throw StoreUnavailableError("failed to insert " + jobLabel(snapshot.jobId) + ": "
                                        + sqlite::lastError(impl->db));
        }

        sqlite::Statement objectStmt(impl->db,
                                     "INSERT INTO snapshot_objects "
                                     "(job_id, object_key, fingerprint) VALUES (?, ?, ?);");
        for (const auto &[key, fingerprint] : snapshot.objects) {
            sqlite3_reset(objectStmt.get());
            sqlite3_clear_bindings(objectStmt.get());
            sqlite3_bind_int64(objectStmt.get(), 1, snapshot.jobId);
            sqlite::bindText(objectStmt.get(), 2, key);
            sqlite::bindBlob(objectStmt.get(), 3, fingerprint);
            if (sqlite3_step(objectStmt.get()) != SQLITE_DONE) {
                throw StoreUnavailableError("failed to insert object '" + key + "' of "
                                            + jobLabel(snapshot.jobId) + ": "
                                            + sqlite::lastError(impl->db));
            }
        }

        sqlite::execOrThrow(impl->db, "COMMIT;");
    } catch (const StoreUnavailableError &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    BTLOG_INFO(QStringLiteral("SqliteSnapshotStore"),
               QStringLiteral("put"),
               QStringLiteral("snapshot_stored"),
               QStringLiteral("ingestion"),
               QStringLiteral("sqlite"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"jobId", snapshot.jobId},
                               {"objects", snapshot.objects.size()}}));
}

std::optional<int64_t> SqliteSnapshotStore::latestJobBefore(int64_t jobId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Statement stmt(impl->db,
                           "SELECT MAX(job_id) FROM snapshots WHERE job_id < ?;");
    sqlite3_bind_int64(stmt.get(), 1, jobId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreUnavailableError("failed to query predecessor of " + jobLabel(jobId)
                                    + ": " + sqlite::lastError(impl->db));
    }
    if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::vector<SnapshotMeta> SqliteSnapshotStore::listSnapshots() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Statement stmt(impl->db,
                           "SELECT job_id, timestamp, latency_ms FROM snapshots "
                           "ORDER BY job_id ASC;");

    std::vector<SnapshotMeta> snapshots;
    int step = SQLITE_ROW;
    while ((step = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        SnapshotMeta meta;
        meta.jobId = sqlite3_column_int64(stmt.get(), 0);
        meta.timestamp = sqlite::fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        meta.latencyMs = sqlite3_column_int64(stmt.get(), 2);
        snapshots.push_back(meta);
    }
    if (step != SQLITE_DONE) {
        throw StoreUnavailableError("failed to list snapshots: " + sqlite::lastError(impl->db));
    }
    return snapshots;
}

} // namespace buildtrace
