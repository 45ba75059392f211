// ═══════════════════════════════════════════════════════════════════
//  database.cpp — SQLite driver implementation
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/database.h"
#include "pagedql/errors.h"
#include <sqlite3.h>
#include <sstream>

namespace pagedql::db {

namespace {

void bindParam(sqlite3* db, sqlite3_stmt* stmt, int index, const nlohmann::json& value) {
    int rc = SQLITE_OK;
    if (value.is_null()) {
        rc = sqlite3_bind_null(stmt, index);
    } else if (value.is_boolean()) {
        rc = sqlite3_bind_int(stmt, index, value.get<bool>() ? 1 : 0);
    } else if (value.is_number_integer()) {
        rc = sqlite3_bind_int64(stmt, index, value.get<int64_t>());
    } else if (value.is_number_float()) {
        rc = sqlite3_bind_double(stmt, index, value.get<double>());
    } else if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        rc = sqlite3_bind_text(stmt, index, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    } else {
        auto text = value.dump();
        rc = sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        throw BackendError("SQL bind error at parameter " + std::to_string(index) + ": " +
                           sqlite3_errmsg(db));
    }
}

nlohmann::json columnValue(sqlite3_stmt* stmt, int i) {
    switch (sqlite3_column_type(stmt, i)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, i));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, i);
        case SQLITE_NULL:
            return nullptr;
        default: {
            auto text = sqlite3_column_text(stmt, i);
            int bytes = sqlite3_column_bytes(stmt, i);
            return text ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes))
                        : std::string();
        }
    }
}

// Finalizes the statement on every exit path
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() { if (stmt) sqlite3_finalize(stmt); }
};

} // namespace

std::string quoteIdent(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

Database::Database(const std::string& path) {
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw BackendError("Failed to open database: " + err);
    }
    // Enable WAL mode for better concurrency
    exec("PRAGMA journal_mode=WAL");
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result Database::exec(const std::string& sql) {
    return run(sql, {}, false);
}

Result Database::exec(const std::string& sql, const Params& params) {
    return run(sql, params, false);
}

Result Database::query(const std::string& sql, const Params& params) {
    return run(sql, params, true);
}

Result Database::run(const std::string& sql, const Params& params, bool readOnly) {
    if (!db_) {
        throw BackendError("Database is closed");
    }

    Result result;
    StatementGuard guard;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &guard.stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw BackendError("SQL error: " + std::string(sqlite3_errmsg(db_)) + " in: " + sql);
    }
    if (!guard.stmt) {
        return result; // empty statement
    }
    if (readOnly && !sqlite3_stmt_readonly(guard.stmt)) {
        throw BackendError("Statement is not read-only: " + sql);
    }

    // Bind parameters
    for (int i = 0; i < static_cast<int>(params.size()); i++) {
        bindParam(db_, guard.stmt, i + 1, params[i]);
    }

    // Get column names
    int colCount = sqlite3_column_count(guard.stmt);
    result.columns.reserve(colCount);
    for (int i = 0; i < colCount; i++) {
        result.columns.push_back(sqlite3_column_name(guard.stmt, i));
    }

    // Execute and fetch rows
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        Row row = nlohmann::json::object();
        for (int i = 0; i < colCount; i++) {
            row[result.columns[i]] = columnValue(guard.stmt, i);
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw BackendError("SQL step error: " + std::string(sqlite3_errmsg(db_)));
    }

    result.affectedRows = sqlite3_changes(db_);
    result.lastInsertId = sqlite3_last_insert_rowid(db_);
    return result;
}

void Database::execMulti(const std::string& sql) {
    if (!db_) {
        throw BackendError("Database is closed");
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw BackendError("SQL exec error: " + err);
    }
}

void Database::beginTransaction() {
    exec("BEGIN TRANSACTION");
}

void Database::commit() {
    exec("COMMIT");
}

void Database::rollback() {
    exec("ROLLBACK");
}

// ═══════════════════════════════════════════
//  QueryBuilder
// ═══════════════════════════════════════════

QueryBuilder& QueryBuilder::join(const SqlJoin& j) {
    for (auto& existing : joins_) {
        if (existing.alias == j.alias) return *this;
    }
    joins_.push_back(j);
    return *this;
}

std::string QueryBuilder::toSql() const {
    std::ostringstream sql;
    sql << "SELECT " << (distinct_ ? "DISTINCT " : "") << columns_
        << " FROM " << quoteIdent(table_);
    if (!alias_.empty()) sql << " AS " << quoteIdent(alias_);

    for (auto& j : joins_) {
        sql << " " << j.clause;
    }

    if (!conditions_.empty()) {
        sql << " WHERE ";
        bool first = true;
        for (auto& c : conditions_) {
            if (!first) sql << " AND ";
            sql << "(" << c << ")";
            first = false;
        }
    }

    if (!orderBy_.empty()) sql << " ORDER BY " << orderBy_;
    if (limit_) {
        sql << " LIMIT " << *limit_;
    } else if (offset_) {
        sql << " LIMIT -1";
    }
    if (offset_) sql << " OFFSET " << *offset_;

    return sql.str();
}

} // namespace pagedql::db
