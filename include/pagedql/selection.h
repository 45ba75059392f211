#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/selection.h — Which results were asked for, and how
// ═══════════════════════════════════════════════════════════════════
//
//  SelectionAnalyzer looks at the direct children of the requested
//  field and at its reserved arguments:
//
//    Books(page: {start: 2, limit: 10}, distinct: false) { records { id } total }
//
//    wantsRecords = true, wantsTotal = true, wantsPages = false
//    window       = {pageNumber: 2, pageSize: 10}
//    distinct     = false
//    stripped     = Books(distinct: false) { records { id } total }
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "query_plan.h"
#include "request.h"
#include <optional>
#include <vector>

namespace pagedql {

struct Selection {
    bool wantsRecords = false;
    bool wantsTotal = false;
    bool wantsPages = false;
    std::optional<PageWindow> window;
    // The request without its pagination argument
    Field strippedRequest;
    bool distinct = defaults::kDistinct;
    // Sub-fields requested under the records selection
    std::vector<Field> recordFields;

    bool wantsCount() const { return wantsTotal || wantsPages; }
};

class SelectionAnalyzer {
public:
    explicit SelectionAnalyzer(ReservedNames names) : names_(std::move(names)) {}

    // Throws ArgumentError for a malformed pagination or distinct argument
    Selection analyze(const Field& field, bool defaultDistinct) const;

    std::optional<PageWindow> extractWindow(const Field& field) const;
    bool resolveDistinct(const Field& field, bool defaultDistinct) const;

    const ReservedNames& names() const { return names_; }

private:
    ReservedNames names_;

    int readPageKey(const nlohmann::json& page, const std::string& key) const;
};

} // namespace pagedql
