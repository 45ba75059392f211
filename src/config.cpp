// ═══════════════════════════════════════════════════════════════════
//  config.cpp — JSON configuration loading
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/config.h"
#include "pagedql/errors.h"
#include <fstream>

namespace pagedql {

namespace {

void readString(const nlohmann::json& j, const char* section, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_string() || v.get_ref<const std::string&>().empty()) {
        throw ArgumentError(section, key, std::string(section) + "." + key + " must be a non-empty string");
    }
    out = v.get<std::string>();
}

void readBool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_boolean()) {
        throw ArgumentError("config", key, std::string(key) + " must be a boolean");
    }
    out = v.get<bool>();
}

void requireObject(const nlohmann::json& j, const char* section) {
    if (!j.is_object()) {
        throw ArgumentError("config", section, std::string(section) + " must be an object");
    }
}

} // namespace

ReservedNames ReservedNames::fromJson(const nlohmann::json& j) {
    requireObject(j, "reserved");
    ReservedNames names;
    readString(j, "reserved", "page", names.page);
    readString(j, "reserved", "start", names.pageStart);
    readString(j, "reserved", "limit", names.pageLimit);
    readString(j, "reserved", "distinct", names.distinct);
    readString(j, "reserved", "where", names.where);
    readString(j, "reserved", "logical", names.logical);
    readString(j, "reserved", "records", names.records);
    readString(j, "reserved", "total", names.total);
    readString(j, "reserved", "pages", names.pages);
    return names;
}

HintNames HintNames::fromJson(const nlohmann::json& j) {
    requireObject(j, "hints");
    HintNames hints;
    readString(j, "hints", "readOnly", hints.readOnly);
    readString(j, "hints", "fetchSize", hints.fetchSize);
    readString(j, "hints", "cacheable", hints.cacheable);
    readString(j, "hints", "passDistinctThrough", hints.passDistinctThrough);
    return hints;
}

ResolverConfig ResolverConfig::fromJson(const nlohmann::json& j) {
    requireObject(j, "config");
    ResolverConfig config;
    if (j.contains("reserved")) config.names = ReservedNames::fromJson(j.at("reserved"));
    if (j.contains("hints")) config.hints = HintNames::fromJson(j.at("hints"));
    readBool(j, "defaultDistinct", config.defaultDistinct);
    readBool(j, "toManyDefaultOptional", config.toManyDefaultOptional);

    if (j.contains("fetchSize")) {
        const auto& v = j.at("fetchSize");
        if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
            throw ArgumentError("config", "fetchSize", "fetchSize must be a positive integer");
        }
        config.fetchSize = v.get<int64_t>();
    }
    return config;
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw Error(ErrorKind::Config, "Cannot open config file: " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw Error(ErrorKind::Config, "Invalid JSON in " + path + ": " + e.what());
    }
}

ResolverConfig loadConfig(const std::string& path) {
    return ResolverConfig::fromJson(readJsonFile(path));
}

} // namespace pagedql
