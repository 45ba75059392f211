// ═══════════════════════════════════════════════════════════════════
//  selection.cpp — Selection analysis and pagination argument parsing
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/selection.h"
#include "pagedql/errors.h"
#include <limits>

namespace pagedql {

Selection SelectionAnalyzer::analyze(const Field& field, bool defaultDistinct) const {
    Selection result;

    const Field* records = field.selection(names_.records);
    result.wantsRecords = records != nullptr;
    result.wantsTotal = field.selection(names_.total) != nullptr;
    result.wantsPages = field.selection(names_.pages) != nullptr;
    if (records) result.recordFields = records->selections;

    // Pagination is consumed here whether or not a records query follows
    result.window = extractWindow(field);
    result.strippedRequest = field.withoutArgument(names_.page);

    result.distinct = resolveDistinct(result.strippedRequest, defaultDistinct);
    return result;
}

std::optional<PageWindow> SelectionAnalyzer::extractWindow(const Field& field) const {
    const Argument* page = field.argument(names_.page);
    if (!page) return std::nullopt;

    if (!page->value.is_object()) {
        throw ArgumentError(names_.page, "",
            "Argument '" + names_.page + "' must be an object with '" +
            names_.pageStart + "' and '" + names_.pageLimit + "'");
    }

    PageWindow window;
    window.pageNumber = readPageKey(page->value, names_.pageStart);
    window.pageSize = readPageKey(page->value, names_.pageLimit);
    return window;
}

int SelectionAnalyzer::readPageKey(const nlohmann::json& page, const std::string& key) const {
    auto it = page.find(key);
    if (it == page.end() || it->is_null()) {
        throw ArgumentError(names_.page, key,
            "Argument '" + names_.page + "' is missing '" + key + "'");
    }
    if (!it->is_number_integer()) {
        throw ArgumentError(names_.page, key,
            "'" + names_.page + "." + key + "' must be an integer");
    }
    auto value = it->get<int64_t>();
    if (value <= 0) {
        throw ArgumentError(names_.page, key,
            "'" + names_.page + "." + key + "' must be positive, got " + std::to_string(value));
    }
    if (value > std::numeric_limits<int>::max()) {
        throw ArgumentError(names_.page, key,
            "'" + names_.page + "." + key + "' is out of range");
    }
    return static_cast<int>(value);
}

bool SelectionAnalyzer::resolveDistinct(const Field& field, bool defaultDistinct) const {
    const Argument* arg = field.argument(names_.distinct);
    if (!arg) return defaultDistinct;
    if (!arg->value.is_boolean()) {
        throw ArgumentError(names_.distinct, "",
            "Argument '" + names_.distinct + "' must be a boolean");
    }
    return arg->value.get<bool>();
}

} // namespace pagedql
