#include "store/sqlite_warehouse_sink.hpp"

#include "common/errors.hpp"
#include "store/sqlite_utils.hpp"

namespace buildtrace {

namespace {

constexpr const char *kCreateJobResultsTable =
    "CREATE TABLE IF NOT EXISTS job_results ("
    "    row_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    job_id TEXT NOT NULL,"
    "    latency_ms INTEGER NOT NULL,"
    "    total_added INTEGER NOT NULL,"
    "    total_removed INTEGER NOT NULL,"
    "    total_modified INTEGER NOT NULL,"
    "    total_unchanged INTEGER NOT NULL"
    ");";

} // namespace

struct SqliteWarehouseSink::Impl {
    sqlite3 *db = nullptr;
};

SqliteWarehouseSink::SqliteWarehouseSink(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->db = sqlite::openDatabase(dbPath);
    try {
        sqlite::execOrThrow(impl->db, kCreateJobResultsTable);
    } catch (const StoreUnavailableError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

SqliteWarehouseSink::~SqliteWarehouseSink()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void SqliteWarehouseSink::insert(const MetricsRecord &record)
{
    try {
        sqlite::Statement stmt(impl->db,
                               "INSERT INTO job_results (timestamp, job_id, latency_ms, "
                               "total_added, total_removed, total_modified, total_unchanged) "
                               "VALUES (?, ?, ?, ?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, sqlite::toEpochSeconds(record.timestamp));
        sqlite::bindText(stmt.get(), 2, std::to_string(record.jobId));
        sqlite3_bind_int64(stmt.get(), 3, record.latencyMs);
        sqlite3_bind_int64(stmt.get(), 4, record.totalAdded);
        sqlite3_bind_int64(stmt.get(), 5, record.totalRemoved);
        sqlite3_bind_int64(stmt.get(), 6, record.totalModified);
        sqlite3_bind_int64(stmt.get(), 7, record.totalUnchanged);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw WarehouseInsertError("failed to insert metrics row for job "
                                       + std::to_string(record.jobId) + ": "
                                       + sqlite::lastError(impl->db));
        }
    } catch (const StoreUnavailableError &ex) {
        throw WarehouseInsertError(ex.what());
    }
}

std::vector<MetricsRecord> SqliteWarehouseSink::listRecords() const
{
    sqlite::Statement stmt(impl->db,
                           "SELECT timestamp, job_id, latency_ms, total_added, "
                           "total_removed, total_modified, total_unchanged "
                           "FROM job_results ORDER BY row_id ASC;");

    std::vector<MetricsRecord> records;
    int step = SQLITE_ROW;
    while ((step = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        MetricsRecord record;
        record.timestamp = sqlite::fromEpochSeconds(sqlite3_column_int64(stmt.get(), 0));
        record.jobId = std::stoll(sqlite::columnText(stmt.get(), 1));
        record.latencyMs = sqlite3_column_int64(stmt.get(), 2);
        record.totalAdded = sqlite3_column_int64(stmt.get(), 3);
        record.totalRemoved = sqlite3_column_int64(stmt.get(), 4);
        record.totalModified = sqlite3_column_int64(stmt.get(), 5);
        record.totalUnchanged = sqlite3_column_int64(stmt.get(), 6);
        records.push_back(record);
    }
    if (step != SQLITE_DONE) {
        throw StoreUnavailableError("failed to read job_results: " + sqlite::lastError(impl->db));
    }
    return records;
}

} // namespace buildtrace
