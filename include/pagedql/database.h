#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/database.h — SQLite driver, query builder, query backend
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    db::Database database(":memory:");
//    db::SqliteBackend session(database, config);
//    auto result = resolver.resolve(field, session);
//
//  Rows come back as JSON objects with typed values (INTEGER -> int64,
//  REAL -> double, TEXT/BLOB -> string, NULL -> null).
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "config.h"
#include "entity.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace pagedql::db {

// ── Query result row: column name -> typed value ──
using Row = nlohmann::json;
using Params = std::vector<nlohmann::json>;

// ── Query result ──
struct Result {
    std::vector<Row> rows;
    std::vector<std::string> columns;
    int affectedRows = 0;
    int64_t lastInsertId = 0;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }
    Row& first() { return rows.front(); }
    const Row& first() const { return rows.front(); }
};

// ═══════════════════════════════════════════
//  SQLite Database Connection
// ═══════════════════════════════════════════
class Database {
public:
    explicit Database(const std::string& path = ":memory:");
    ~Database();

    // Non-copyable, movable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    // ── Execute a query ──
    Result exec(const std::string& sql);

    // ── Execute with bound parameters ──
    Result exec(const std::string& sql, const Params& params);

    // ── Execute a statement that must not write; BackendError otherwise ──
    Result query(const std::string& sql, const Params& params);

    // ── Execute multiple statements (migrations, etc.) ──
    void execMulti(const std::string& sql);

    // ── Transaction helpers ──
    void beginTransaction();
    void commit();
    void rollback();

    // ── Transaction scope guard ──
    template <typename Func>
    auto transaction(Func&& fn) -> decltype(fn()) {
        beginTransaction();
        try {
            auto result = fn();
            commit();
            return result;
        } catch (...) {
            rollback();
            throw;
        }
    }

    bool isOpen() const { return db_ != nullptr; }
    void close();

private:
    sqlite3* db_ = nullptr;

    Result run(const std::string& sql, const Params& params, bool readOnly);
};

// ── Join required by a predicate, de-duplicated by alias ──
struct SqlJoin {
    std::string alias;
    std::string clause;

    bool operator==(const SqlJoin& other) const {
        return alias == other.alias && clause == other.clause;
    }
};

// ── Predicate node produced by the SQL compilers ──
class SqlPredicate : public PredicateNode {
public:
    SqlPredicate(PredicateKind kind, std::string source, std::string sql,
                 Params params = {}, std::vector<SqlJoin> joins = {})
        : PredicateNode(kind, std::move(source)),
          sql_(std::move(sql)), params_(std::move(params)), joins_(std::move(joins)) {}

    const std::string& sql() const { return sql_; }
    const Params& params() const { return params_; }
    const std::vector<SqlJoin>& joins() const { return joins_; }

    std::string describe() const override { return sql_; }

private:
    std::string sql_;
    Params params_;
    std::vector<SqlJoin> joins_;
};

// Double-quoted SQL identifier
std::string quoteIdent(const std::string& name);

// ═══════════════════════════════════════════
//  Query Builder (fluent API)
// ═══════════════════════════════════════════
class QueryBuilder {
public:
    explicit QueryBuilder(Database& db) : db_(db) {}

    QueryBuilder& table(const std::string& name, const std::string& alias = "") {
        table_ = name;
        alias_ = alias;
        return *this;
    }

    QueryBuilder& select(const std::string& cols = "*") {
        columns_ = cols;
        return *this;
    }

    QueryBuilder& distinct(bool on = true) { distinct_ = on; return *this; }

    QueryBuilder& join(const SqlJoin& j);

    QueryBuilder& where(const std::string& condition, const Params& params = {}) {
        conditions_.push_back(condition);
        params_.insert(params_.end(), params.begin(), params.end());
        return *this;
    }

    QueryBuilder& orderBy(const std::string& col, const std::string& dir = "ASC") {
        orderBy_ = col + " " + dir;
        return *this;
    }

    QueryBuilder& limit(int64_t n) { limit_ = n; return *this; }
    QueryBuilder& offset(int64_t n) { offset_ = n; return *this; }

    // ── Build SQL string ──
    std::string toSql() const;
    const Params& params() const { return params_; }

    // ── Execute ──
    Result run() { return db_.exec(toSql(), params_); }
    Result runReadOnly() { return db_.query(toSql(), params_); }

private:
    Database& db_;
    std::string table_;
    std::string alias_;
    std::string columns_ = "*";
    bool distinct_ = false;
    std::vector<SqlJoin> joins_;
    std::vector<std::string> conditions_;
    Params params_;
    std::string orderBy_;
    std::optional<int64_t> limit_;
    std::optional<int64_t> offset_;
};

// ── Convenience: start a query builder ──
inline QueryBuilder query(Database& db) {
    return QueryBuilder(db);
}

// ═══════════════════════════════════════════
//  QueryBackend over one Database
// ═══════════════════════════════════════════

class SqliteContentQuery : public ContentQuery {
public:
    SqliteContentQuery(Database& db, const EntityType& entity, const HintNames& hintNames);

    void addPredicate(const Predicate& predicate) override;
    void setOffset(int64_t offset) override;
    void setLimit(int64_t limit) override;
    void setDistinct(bool distinct) override { distinct_ = distinct; }
    void setHint(const std::string& name, const nlohmann::json& value) override;
    std::vector<Entity> execute() override;

    // SQL the query would run; for logs and tests
    std::string toSql() const;

private:
    Database& db_;
    const EntityType& entity_;
    const HintNames& hintNames_;
    std::vector<std::shared_ptr<const SqlPredicate>> predicates_;
    std::optional<int64_t> offset_;
    std::optional<int64_t> limit_;
    bool distinct_ = false;
    bool readOnly_ = false;
    bool passDistinctThrough_ = true;

    QueryBuilder build() const;
};

class SqliteCountQuery : public CountQuery {
public:
    SqliteCountQuery(Database& db, const EntityType& entity);

    void addPredicate(const Predicate& predicate) override;
    int64_t executeScalar() override;

    std::string toSql() const;

private:
    Database& db_;
    const EntityType& entity_;
    std::vector<std::shared_ptr<const SqlPredicate>> predicates_;

    QueryBuilder build() const;
};

class SqliteBackend : public QueryBackend {
public:
    // Hint names must match the resolver's, or its hints are ignored
    explicit SqliteBackend(Database& db, HintNames hintNames = {})
        : db_(db), hintNames_(std::move(hintNames)) {}
    SqliteBackend(Database& db, const ResolverConfig& config)
        : SqliteBackend(db, config.hints) {}

    std::unique_ptr<ContentQuery> buildQuery(const EntityType& entity) override;
    std::unique_ptr<CountQuery> buildCountQuery(const EntityType& entity) override;

private:
    Database& db_;
    HintNames hintNames_;
};

} // namespace pagedql::db
