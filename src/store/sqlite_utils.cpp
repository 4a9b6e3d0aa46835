#include "store/sqlite_utils.hpp"

#include <filesystem>
#include <system_error>

#include "common/errors.hpp"

namespace buildtrace::sqlite {

Statement::Statement(sqlite3 *db, const char *sql)
{
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreUnavailableError("sqlite prepare failed: " + lastError(db));
    }
}

Statement::~Statement()
{
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

sqlite3 *openDatabase(const std::string &path)
{
    const std::filesystem::path dbPath(path);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
        if (error) {
            throw StoreUnavailableError("cannot create directory for " + path + ": "
                                        + error.message());
        }
    }

    sqlite3 *db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreUnavailableError("failed to open database " + path + ": " + message);
    }
    sqlite3_busy_timeout(db, 2000);
    return db;
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreUnavailableError(message);
    }
}

std::string lastError(sqlite3 *db)
{
    return db ? sqlite3_errmsg(db) : "no database";
}

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void bindBlob(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    const int size = sqlite3_column_bytes(stmt, index);
    return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(size));
}

std::string columnBlob(sqlite3_stmt *stmt, int index)
{
    const void *data = sqlite3_column_blob(stmt, index);
    const int size = sqlite3_column_bytes(stmt, index);
    if (!data || size <= 0) {
        return {};
    }
    return std::string(static_cast<const char *>(data), static_cast<size_t>(size));
}

} // namespace buildtrace::sqlite
