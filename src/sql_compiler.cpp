// ═══════════════════════════════════════════════════════════════════
//  sql_compiler.cpp — Field and where-filter compilation to SQL
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/sql_compiler.h"
#include "pagedql/errors.h"
#include <functional>
#include <unordered_map>

namespace pagedql::db {

namespace {

struct Fragment {
    std::string sql;
    Params params;
    std::vector<SqlJoin> joins;
    PredicateKind kind = PredicateKind::Comparison;

    bool empty() const { return sql.empty(); }
};

// ── Table a filter object is evaluated against ──
struct Target {
    std::string alias;
    std::string name;
    std::function<bool(const std::string&)> hasColumn;
    // Set only on the root entity: relations may be followed from there
    const EntityType* entity = nullptr;
};

std::string columnRef(const std::string& alias, const std::string& column) {
    return quoteIdent(alias) + "." + quoteIdent(column);
}

void requireScalar(const nlohmann::json& value, const std::string& path) {
    if (value.is_object() || value.is_array()) {
        throw PredicateError(path, "Expected a scalar value at '" + path + "'");
    }
}

Fragment inList(const std::string& ref, const nlohmann::json& values, bool negate,
                const std::string& path) {
    if (!values.is_array()) {
        throw PredicateError(path, "Expected a list at '" + path + "'");
    }
    Fragment f;
    if (values.empty()) {
        f.sql = negate ? "1 = 1" : "0 = 1";
        return f;
    }
    std::string placeholders;
    for (auto& v : values) {
        requireScalar(v, path);
        if (!placeholders.empty()) placeholders += ", ";
        placeholders += "?";
        f.params.push_back(v);
    }
    f.sql = ref + (negate ? " NOT IN (" : " IN (") + placeholders + ")";
    return f;
}

Fragment comparison(const std::string& ref, const std::string& op, const nlohmann::json& value,
                    const std::string& path) {
    Fragment f;
    if (op == "IN" || op == "NIN") {
        return inList(ref, value, op == "NIN", path);
    }
    if (op == "IS_NULL") {
        if (!value.is_boolean()) {
            throw PredicateError(path, "IS_NULL expects a boolean at '" + path + "'");
        }
        f.sql = ref + (value.get<bool>() ? " IS NULL" : " IS NOT NULL");
        return f;
    }

    requireScalar(value, path);
    if (value.is_null()) {
        if (op == "EQ") { f.sql = ref + " IS NULL"; return f; }
        if (op == "NE") { f.sql = ref + " IS NOT NULL"; return f; }
        throw PredicateError(path, op + " does not accept null at '" + path + "'");
    }

    static const std::unordered_map<std::string, const char*> operators = {
        {"EQ", " = ?"}, {"NE", " <> ?"},
        {"LT", " < ?"}, {"LE", " <= ?"},
        {"GT", " > ?"}, {"GE", " >= ?"},
        {"LIKE", " LIKE ?"},
    };
    auto it = operators.find(op);
    if (it == operators.end()) {
        throw PredicateError(path, "Unknown operator '" + op + "' at '" + path + "'");
    }
    if (op == "LIKE" && !value.is_string()) {
        throw PredicateError(path, "LIKE expects a string at '" + path + "'");
    }
    f.sql = ref + it->second;
    f.params.push_back(value);
    return f;
}

Fragment combine(std::vector<Fragment> parts, const char* glue) {
    std::vector<Fragment> nonEmpty;
    for (auto& p : parts) {
        if (!p.empty()) nonEmpty.push_back(std::move(p));
    }
    if (nonEmpty.empty()) return {};
    if (nonEmpty.size() == 1) return std::move(nonEmpty.front());

    Fragment out;
    out.kind = PredicateKind::Logical;
    for (auto& p : nonEmpty) {
        if (!out.sql.empty()) out.sql += glue;
        out.sql += "(" + p.sql + ")";
        out.params.insert(out.params.end(), p.params.begin(), p.params.end());
        for (auto& j : p.joins) {
            bool seen = false;
            for (auto& existing : out.joins) seen = seen || existing.alias == j.alias;
            if (!seen) out.joins.push_back(j);
        }
    }
    return out;
}

Fragment compileColumn(const Target& target, const std::string& column, const nlohmann::json& value,
                       const std::string& path) {
    auto ref = columnRef(target.alias, column);
    if (!value.is_object()) {
        if (value.is_array()) return inList(ref, value, false, path);
        return comparison(ref, "EQ", value, path);
    }
    std::vector<Fragment> parts;
    for (auto& [op, operand] : value.items()) {
        parts.push_back(comparison(ref, op, operand, path + "." + op));
    }
    return combine(std::move(parts), " AND ");
}

SqlJoin relationJoin(const Relation& rel, const std::string& rootId, bool toManyOptional) {
    SqlJoin join;
    join.alias = rel.name;
    if (rel.kind == Relation::Kind::OneToMany) {
        join.clause = std::string(toManyOptional ? "LEFT JOIN " : "INNER JOIN ") +
                      quoteIdent(rel.table) + " AS " + quoteIdent(rel.name) + " ON " +
                      columnRef(rel.name, rel.foreignKey) + " = " +
                      columnRef(kRootAlias, rootId);
    } else {
        join.clause = "LEFT JOIN " + quoteIdent(rel.table) + " AS " + quoteIdent(rel.name) +
                      " ON " + columnRef(rel.name, rel.idColumn) + " = " +
                      columnRef(kRootAlias, rel.foreignKey);
    }
    return join;
}

Fragment compileObject(const Target& target, const nlohmann::json& filter, const std::string& path,
                       const PredicateContext& context);

Fragment compileLogical(const Target& target, const std::string& op, const nlohmann::json& value,
                        const std::string& path, const PredicateContext& context) {
    if (op == "NOT") {
        if (!value.is_object()) {
            throw PredicateError(path, "NOT expects an object at '" + path + "'");
        }
        auto inner = compileObject(target, value, path, context);
        if (inner.empty()) return inner;
        inner.sql = "NOT (" + inner.sql + ")";
        inner.kind = PredicateKind::Logical;
        return inner;
    }

    const char* glue = op == "AND" ? " AND " : " OR ";
    std::vector<Fragment> parts;
    if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); i++) {
            auto itemPath = path + "[" + std::to_string(i) + "]";
            if (!value[i].is_object()) {
                throw PredicateError(itemPath, op + " expects objects at '" + itemPath + "'");
            }
            parts.push_back(compileObject(target, value[i], itemPath, context));
        }
    } else if (value.is_object()) {
        // {a: ..., b: ...} under OR means a OR b
        for (auto& [key, inner] : value.items()) {
            parts.push_back(compileObject(target, nlohmann::json{{key, inner}}, path, context));
        }
    } else {
        throw PredicateError(path, op + " expects an object or a list at '" + path + "'");
    }

    auto out = combine(std::move(parts), glue);
    if (!out.empty()) out.kind = PredicateKind::Logical;
    return out;
}

Fragment compileObject(const Target& target, const nlohmann::json& filter, const std::string& path,
                       const PredicateContext& context) {
    std::vector<Fragment> parts;
    for (auto& [key, value] : filter.items()) {
        auto keyPath = path + "." + key;
        if (key == "AND" || key == "OR" || key == "NOT") {
            parts.push_back(compileLogical(target, key, value, keyPath, context));
            continue;
        }
        if (target.hasColumn(key)) {
            parts.push_back(compileColumn(target, key, value, keyPath));
            continue;
        }

        const Relation* rel = target.entity ? target.entity->relation(key) : nullptr;
        if (!rel) {
            throw PredicateError(keyPath, "Unknown field '" + key + "' on '" + target.name + "'");
        }
        if (!value.is_object()) {
            throw PredicateError(keyPath, "Relation filter '" + keyPath + "' must be an object");
        }
        if (rel->name == kRootAlias) {
            throw PredicateError(keyPath, "Relation name '" + rel->name + "' clashes with the root alias");
        }

        Target related;
        related.alias = rel->name;
        related.name = rel->table;
        related.hasColumn = [rel](const std::string& c) { return rel->hasColumn(c); };

        auto join = relationJoin(*rel, target.entity->idColumn, context.toManyOptional);

        auto inner = compileObject(related, value, keyPath, context);
        if (inner.empty()) continue;
        inner.joins.insert(inner.joins.begin(), join);
        inner.kind = PredicateKind::Where;
        parts.push_back(std::move(inner));
    }
    return combine(std::move(parts), " AND ");
}

std::shared_ptr<const SqlPredicate> toPredicate(Fragment f, PredicateKind kind, const std::string& source) {
    return std::make_shared<const SqlPredicate>(kind, source, std::move(f.sql),
                                                std::move(f.params), std::move(f.joins));
}

void requireEntity(const PredicateContext& context, const std::string& path) {
    if (!context.entity) {
        throw PredicateError(path, "No entity type in predicate context for '" + path + "'");
    }
}

} // namespace

// ═══════════════════════════════════════════
//  SqlFieldCompiler
// ═══════════════════════════════════════════

std::optional<Predicate> SqlFieldCompiler::compilePredicate(const PredicateContext& context,
                                                            const Argument& argument) const {
    requireEntity(context, argument.name);
    const EntityType& entity = *context.entity;
    if (!entity.hasColumn(argument.name)) {
        throw PredicateError(argument.name,
            "Unknown field '" + argument.name + "' on '" + entity.name + "'");
    }
    if (argument.value.is_object()) {
        throw PredicateError(argument.name,
            "Field argument '" + argument.name + "' must be a scalar or a list");
    }

    auto ref = columnRef(kRootAlias, argument.name);
    Fragment f = argument.value.is_array()
        ? inList(ref, argument.value, false, argument.name)
        : comparison(ref, "EQ", argument.value, argument.name);
    return toPredicate(std::move(f), PredicateKind::Comparison, argument.name);
}

// ═══════════════════════════════════════════
//  SqlFilterCompiler
// ═══════════════════════════════════════════

std::optional<Predicate> SqlFilterCompiler::compilePredicate(const PredicateContext& context,
                                                             const Argument& argument) const {
    const std::string path = context.path.empty() ? argument.name : context.path;
    requireEntity(context, path);
    if (context.scope.is_null()) return std::nullopt;
    if (!context.scope.is_object()) {
        throw PredicateError(path, "Filter '" + path + "' must be an object");
    }

    const EntityType& entity = *context.entity;
    Target root;
    root.alias = kRootAlias;
    root.name = entity.name;
    root.hasColumn = [&entity](const std::string& c) { return entity.hasColumn(c); };
    root.entity = &entity;

    auto f = compileObject(root, context.scope, path, context);
    if (f.empty()) return std::nullopt;
    return toPredicate(std::move(f), PredicateKind::Where, argument.name);
}

} // namespace pagedql::db
