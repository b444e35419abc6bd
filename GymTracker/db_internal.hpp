#pragma once
#include <optional>
#include <string>
#include <sqlite3.h>

/*
-------------------------------------------------------------------------------
 db_internal.hpp - Statement helpers shared by the db_*.cpp files
-------------------------------------------------------------------------------
Not part of the public interface; only the persistence sources include it.
-------------------------------------------------------------------------------
*/

/// Run a raw SQL string with sqlite3_exec and report errors to std::cerr.
bool exec_sql(sqlite3* db, const char* sql);

/// Print "<what>: <sqlite3_errmsg>" to std::cerr.
void log_sql_error(sqlite3* db, const char* what);

/// Owns a prepared statement; finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return st_ != nullptr; }
    sqlite3_stmt* get() const { return st_; }

private:
    sqlite3_stmt* st_ = nullptr;
};

// NULL-safe column readers.
std::string column_text(sqlite3_stmt* st, int col);
std::optional<double> column_opt_double(sqlite3_stmt* st, int col);

// Binds NULL for an empty optional.
void bind_opt_double(sqlite3_stmt* st, int idx, const std::optional<double>& v);
void bind_text(sqlite3_stmt* st, int idx, const std::string& s);
