// ═══════════════════════════════════════════════════════════════════
//  sqlite_backend.cpp — QueryBackend implementation over SQLite
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/database.h"
#include "pagedql/console.h"
#include "pagedql/errors.h"

namespace pagedql::db {

namespace {

std::shared_ptr<const SqlPredicate> asSqlPredicate(const Predicate& predicate) {
    if (!predicate) {
        throw BackendError("Null predicate passed to SQLite query");
    }
    auto sql = std::dynamic_pointer_cast<const SqlPredicate>(predicate);
    if (!sql) {
        throw BackendError("Predicate '" + predicate->describe() + "' from argument '" +
                           predicate->source() + "' was not produced by a SQL compiler");
    }
    return sql;
}

std::string rootColumn(const std::string& column) {
    return quoteIdent(kRootAlias) + "." + quoteIdent(column);
}

void applyPredicates(QueryBuilder& qb, const std::vector<std::shared_ptr<const SqlPredicate>>& predicates) {
    for (auto& p : predicates) {
        for (auto& j : p->joins()) qb.join(j);
        qb.where(p->sql(), p->params());
    }
}

} // namespace

// ═══════════════════════════════════════════
//  SqliteContentQuery
// ═══════════════════════════════════════════

SqliteContentQuery::SqliteContentQuery(Database& db, const EntityType& entity, const HintNames& hintNames)
    : db_(db), entity_(entity), hintNames_(hintNames) {}

void SqliteContentQuery::addPredicate(const Predicate& predicate) {
    predicates_.push_back(asSqlPredicate(predicate));
}

void SqliteContentQuery::setOffset(int64_t offset) {
    if (offset < 0) throw BackendError("Negative offset " + std::to_string(offset));
    offset_ = offset;
}

void SqliteContentQuery::setLimit(int64_t limit) {
    if (limit < 0) throw BackendError("Negative limit " + std::to_string(limit));
    limit_ = limit;
}

void SqliteContentQuery::setHint(const std::string& name, const nlohmann::json& value) {
    if (name == hintNames_.readOnly && value.is_boolean()) {
        readOnly_ = value.get<bool>();
    } else if (name == hintNames_.passDistinctThrough && value.is_boolean()) {
        passDistinctThrough_ = value.get<bool>();
    } else {
        // Fetch size and caching have no SQLite counterpart: rows are always
        // stepped one at a time and nothing is cached between statements
        console::debug("sqlite: ignoring hint", name, "=", value.dump());
    }
}

QueryBuilder SqliteContentQuery::build() const {
    QueryBuilder qb(db_);
    qb.table(entity_.table, kRootAlias)
      .select(quoteIdent(kRootAlias) + ".*")
      .distinct(distinct_ && passDistinctThrough_);
    applyPredicates(qb, predicates_);
    // Stable order so consecutive pages do not overlap
    qb.orderBy(rootColumn(entity_.idColumn));
    if (limit_) qb.limit(*limit_);
    if (offset_) qb.offset(*offset_);
    return qb;
}

std::string SqliteContentQuery::toSql() const {
    return build().toSql();
}

std::vector<Entity> SqliteContentQuery::execute() {
    auto qb = build();
    console::debug("sqlite:", qb.toSql());
    auto result = readOnly_ ? qb.runReadOnly() : qb.run();

    std::vector<Entity> entities;
    entities.reserve(result.rows.size());
    for (auto& row : result.rows) {
        auto id = row.find(entity_.idColumn);
        if (id == row.end()) {
            throw BackendError("Row of '" + entity_.table + "' has no identity column '" +
                               entity_.idColumn + "'");
        }
        Entity e;
        e.type = entity_.name;
        e.id = *id;
        e.attributes = std::move(row);
        entities.push_back(std::move(e));
    }
    return entities;
}

// ═══════════════════════════════════════════
//  SqliteCountQuery
// ═══════════════════════════════════════════

SqliteCountQuery::SqliteCountQuery(Database& db, const EntityType& entity)
    : db_(db), entity_(entity) {}

void SqliteCountQuery::addPredicate(const Predicate& predicate) {
    predicates_.push_back(asSqlPredicate(predicate));
}

QueryBuilder SqliteCountQuery::build() const {
    QueryBuilder qb(db_);
    qb.table(entity_.table, kRootAlias)
      .select("count(" + rootColumn(entity_.idColumn) + ") AS total");
    applyPredicates(qb, predicates_);
    return qb;
}

std::string SqliteCountQuery::toSql() const {
    return build().toSql();
}

int64_t SqliteCountQuery::executeScalar() {
    auto qb = build();
    console::debug("sqlite:", qb.toSql());
    auto result = qb.runReadOnly();
    if (result.empty() || !result.first().contains("total") ||
        !result.first()["total"].is_number_integer()) {
        throw BackendError("Count query on '" + entity_.table + "' returned no integer");
    }
    return result.first()["total"].get<int64_t>();
}

// ═══════════════════════════════════════════
//  SqliteBackend
// ═══════════════════════════════════════════

std::unique_ptr<ContentQuery> SqliteBackend::buildQuery(const EntityType& entity) {
    return std::make_unique<SqliteContentQuery>(db_, entity, hintNames_);
}

std::unique_ptr<CountQuery> SqliteBackend::buildCountQuery(const EntityType& entity) {
    return std::make_unique<SqliteCountQuery>(db_, entity);
}

} // namespace pagedql::db
