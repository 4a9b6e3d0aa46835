#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <sqlite3.h>

namespace buildtrace::sqlite {

// RAII wrapper for a prepared statement. Throws StoreUnavailableError if
// preparation fails.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

// Opens (creating parent directories) in serialized threading mode.
sqlite3 *openDatabase(const std::string &path);

void execOrThrow(sqlite3 *db, const char *sql);
std::string lastError(sqlite3 *db);

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point fromEpochSeconds(int64_t value);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindBlob(sqlite3_stmt *stmt, int index, const std::string &value);
std::string columnText(sqlite3_stmt *stmt, int index);
std::string columnBlob(sqlite3_stmt *stmt, int index);

} // namespace buildtrace::sqlite
