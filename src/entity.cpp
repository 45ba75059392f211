// ═══════════════════════════════════════════════════════════════════
//  entity.cpp — Entity metadata lookups and JSON loading
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/entity.h"
#include "pagedql/errors.h"
#include <algorithm>

namespace pagedql {

namespace {

std::string requireString(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get_ref<const std::string&>().empty()) {
        throw ArgumentError(where, key, where + "." + key + " must be a non-empty string");
    }
    return j.at(key).get<std::string>();
}

std::vector<std::string> readColumns(const nlohmann::json& j, const std::string& where) {
    std::vector<std::string> columns;
    if (!j.contains("columns")) return columns;
    const auto& arr = j.at("columns");
    if (!arr.is_array()) {
        throw ArgumentError(where, "columns", where + ".columns must be an array");
    }
    for (auto& c : arr) {
        if (!c.is_string()) {
            throw ArgumentError(where, "columns", where + ".columns must contain strings");
        }
        columns.push_back(c.get<std::string>());
    }
    return columns;
}

} // namespace

bool Relation::hasColumn(const std::string& column) const {
    return column == idColumn || column == foreignKey ||
           std::find(columns.begin(), columns.end(), column) != columns.end();
}

bool EntityType::hasColumn(const std::string& column) const {
    return column == idColumn ||
           std::find(columns.begin(), columns.end(), column) != columns.end();
}

const Relation* EntityType::relation(const std::string& relationName) const {
    for (auto& r : relations) {
        if (r.name == relationName) return &r;
    }
    return nullptr;
}

EntityType EntityType::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ArgumentError("entities", "", "entity definition must be an object");
    }
    EntityType type;
    type.name = requireString(j, "name", "entity");
    type.table = j.contains("table") ? requireString(j, "table", type.name) : type.name;
    if (j.contains("id")) type.idColumn = requireString(j, "id", type.name);
    type.columns = readColumns(j, type.name);

    if (j.contains("relations")) {
        const auto& rels = j.at("relations");
        if (!rels.is_array()) {
            throw ArgumentError(type.name, "relations", type.name + ".relations must be an array");
        }
        for (auto& r : rels) {
            Relation rel;
            rel.name = requireString(r, "name", type.name + ".relations");
            auto where = type.name + "." + rel.name;
            if (rel.name == kRootAlias) {
                throw ArgumentError(where, "name", "relation name '" + rel.name + "' is reserved");
            }
            rel.table = requireString(r, "table", where);
            rel.foreignKey = requireString(r, "foreignKey", where);
            if (r.contains("id")) rel.idColumn = requireString(r, "id", where);
            rel.columns = readColumns(r, where);

            auto kind = r.contains("kind") ? requireString(r, "kind", where) : std::string("oneToMany");
            if (kind == "oneToMany") {
                rel.kind = Relation::Kind::OneToMany;
            } else if (kind == "manyToOne") {
                rel.kind = Relation::Kind::ManyToOne;
            } else {
                throw ArgumentError(where, "kind", "unknown relation kind '" + kind + "'");
            }
            type.relations.push_back(std::move(rel));
        }
    }
    return type;
}

} // namespace pagedql
