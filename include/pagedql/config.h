#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/config.h — Reserved names, hint names, resolver settings
// ═══════════════════════════════════════════════════════════════════
//
//  Loaded from JSON:
//
//    {
//      "reserved": { "page": "page", "records": "select" },
//      "hints":    { "fetchSize": "org.hibernate.fetchSize" },
//      "defaultDistinct": true,
//      "fetchSize": 1000,
//      "toManyDefaultOptional": true,
//      "entities": [ ... ]          // see EntityType::fromJson
//    }
//
//  Every key is optional; missing keys keep the defaults below.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace pagedql {

namespace defaults {
constexpr int64_t kFetchSize = 1000;
constexpr bool kDistinct = true;
constexpr bool kToManyOptional = true;
} // namespace defaults

// ── Argument and selection names the resolver treats specially ──
struct ReservedNames {
    std::string page = "page";
    std::string pageStart = "start";
    std::string pageLimit = "limit";
    std::string distinct = "distinct";
    std::string where = "where";
    std::string logical = "logical";
    std::string records = "records";
    std::string total = "total";
    std::string pages = "pages";

    static ReservedNames fromJson(const nlohmann::json& j);
};

// ── Execution hint keys handed to the backend verbatim ──
struct HintNames {
    std::string readOnly = "pagedql.readOnly";
    std::string fetchSize = "pagedql.fetchSize";
    std::string cacheable = "pagedql.cacheable";
    std::string passDistinctThrough = "pagedql.passDistinctThrough";

    static HintNames fromJson(const nlohmann::json& j);
};

struct ResolverConfig {
    ReservedNames names;
    HintNames hints;
    bool defaultDistinct = defaults::kDistinct;
    int64_t fetchSize = defaults::kFetchSize;
    // One-to-many relation filters keep root rows without matches
    bool toManyDefaultOptional = defaults::kToManyOptional;

    static ResolverConfig fromJson(const nlohmann::json& j);
};

// Reads and parses a JSON document; throws Error(ErrorKind::Config) on I/O or syntax failure
nlohmann::json readJsonFile(const std::string& path);

ResolverConfig loadConfig(const std::string& path);

} // namespace pagedql
