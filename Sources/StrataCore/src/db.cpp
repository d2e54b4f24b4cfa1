#include "strata/db.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <thread>

namespace strata {

database::database(const std::string& path, open_mode mode, int busy_timeout_ms) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error, rc);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // Cascading deletes of hierarchy rows depend on this.
    execute("PRAGMA foreign_keys = ON");

    // WAL only for file-backed writers; in-memory databases keep their journal.
    if (mode == open_mode::read_write && path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");
    LOG_DEBUG("db", "opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.db_ = nullptr;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")", rc);
        }
    } else {
        statement stmt(*this, sql);
        stmt.execute(params);
    }
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement", rc);
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    std::string sql = "PRAGMA table_info(" + table + ")";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_info statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare table_info statement", rc);
    }

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));

        if (name && type) {
            std::string type_str(type);
            for (char& c : type_str) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            columns[name] = type_str;
        }
    }

    sqlite3_finalize(stmt);
    return columns;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return text ? std::string(text, static_cast<size_t>(size)) : std::string();
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? std::vector<uint8_t>(bytes, bytes + size) : std::vector<uint8_t>();
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

void database::insert(const std::string& table,
                      const std::vector<std::pair<std::string, column_value_t>>& values,
                      const std::vector<std::string>& conflict_columns) {
    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << col;
        first = false;
    }

    sql << ") VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    // Add ON CONFLICT clause for upsert if conflict_columns provided
    if (!conflict_columns.empty()) {
        sql << " ON CONFLICT (";
        first = true;
        for (const auto& col : conflict_columns) {
            if (!first) sql << ", ";
            sql << col;
            first = false;
        }
        std::ostringstream updates;
        first = true;
        for (const auto& [col, _] : values) {
            if (std::find(conflict_columns.begin(), conflict_columns.end(), col) != conflict_columns.end()) continue;
            if (!first) updates << ", ";
            updates << col << " = excluded." << col;
            first = false;
        }
        if (first) {
            sql << ") DO NOTHING";
        } else {
            sql << ") DO UPDATE SET " << updates.str();
        }
    }

    std::vector<column_value_t> params;
    params.reserve(values.size());
    for (const auto& [_, val] : values) params.push_back(val);

    statement stmt(*this, sql.str());
    stmt.execute(params);
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(*this, sql);
    stmt.bind_all(params);

    std::vector<row_t> results;
    int col_count = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            row[stmt.column_name(i)] = stmt.column(i);
        }
        results.push_back(std::move(row));
    }
    return results;
}

void database::begin_transaction() {
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Wait out a writer on another connection with capped exponential backoff.
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error, rc);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// statement
// ============================================================================

statement::statement(database& db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_.handle()));
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")", rc);
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind_all(const std::vector<column_value_t>& params) {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    int index = 1;
    for (const auto& param : params) {
        db_.bind_value(stmt_, index++, param);
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    auto error = std::string(sqlite3_errmsg(db_.handle()));
    LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
    sqlite3_reset(stmt_);
    throw db_error("Execution failed: " + error + " (SQL: " + sql_ + ")", rc);
}

void statement::execute(const std::vector<column_value_t>& params) {
    bind_all(params);
    while (step()) {
    }
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "rollback in transaction guard failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    completed_ = true;
    if (db_.is_in_transaction()) {
        db_.rollback();
    }
}

} // namespace strata
