#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/entity.h — Entity metadata and fetched entity rows
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pagedql {

// Alias the root table is selected under; no relation may take it
inline constexpr const char* kRootAlias = "root";

// ── Relation from the root table to another table ──
//  OneToMany: related.foreignKey references root.idColumn
//  ManyToOne: root.foreignKey references related.idColumn
struct Relation {
    enum class Kind { OneToMany, ManyToOne };

    std::string name;
    std::string table;
    std::string foreignKey;
    std::string idColumn = "id";
    std::vector<std::string> columns;
    Kind kind = Kind::OneToMany;

    bool hasColumn(const std::string& column) const;
};

struct EntityType {
    std::string name;
    std::string table;
    std::string idColumn = "id";
    std::vector<std::string> columns;
    std::vector<Relation> relations;

    bool hasColumn(const std::string& column) const;
    const Relation* relation(const std::string& relationName) const;

    //  { "name": "Book", "table": "books", "id": "id",
    //    "columns": ["id", "title"],
    //    "relations": [ { "name": "tags", "table": "book_tags",
    //                     "foreignKey": "book_id", "kind": "oneToMany",
    //                     "columns": ["book_id", "tag"] } ] }
    static EntityType fromJson(const nlohmann::json& j);
};

// ── One fetched root row ──
//  Equality is identity: same entity type and same id value.
struct Entity {
    std::string type;
    nlohmann::json id;
    nlohmann::json attributes = nlohmann::json::object();

    bool operator==(const Entity& other) const {
        return type == other.type && id == other.id;
    }
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

} // namespace pagedql

template <>
struct std::hash<pagedql::Entity> {
    std::size_t operator()(const pagedql::Entity& e) const noexcept {
        std::size_t h = std::hash<std::string>{}(e.type);
        return h ^ (std::hash<nlohmann::json>{}(e.id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
