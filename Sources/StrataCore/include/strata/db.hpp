#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

/// Raised by the SQLite wrapper. The store wraps it in persistence_error.
class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write, int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    bool table_exists(const std::string& name) const;

    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // conflict_columns: if non-empty, generates ON CONFLICT (...) DO UPDATE SET for upsert
    void insert(const std::string& table,
                const std::vector<std::pair<std::string, column_value_t>>& values,
                const std::vector<std::string>& conflict_columns = {});

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params. Without params the text may hold
    // several statements.
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows changed by the most recent INSERT, UPDATE or DELETE.
    int changes() const { return sqlite3_changes(db_); }

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
};

/// Prepared statement reused across executions, e.g. one per batch of rows.
class statement {
public:
    statement(database& db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// Resets, binds params and runs to completion.
    void execute(const std::vector<column_value_t>& params);

    /// Resets and binds params for a step() loop.
    void bind_all(const std::vector<column_value_t>& params);

    /// True while a row is available.
    bool step();

    int column_count() const { return sqlite3_column_count(stmt_); }
    std::string column_name(int index) const { return sqlite3_column_name(stmt_, index); }
    column_value_t column(int index) const { return database::extract_column(stmt_, index); }

private:
    database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace strata

#endif // __cplusplus
