#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/query_plan.h — Page window, execution hints, query plan
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "config.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace pagedql {

// ── Requested page, both values >= 1 ──
//  An absent window (std::nullopt) means "no pagination": the content
//  query gets neither offset nor limit.
struct PageWindow {
    int pageNumber = 1;
    int pageSize = 1;

    int64_t offset() const { return static_cast<int64_t>(pageNumber - 1) * pageSize; }
    int64_t limit() const { return pageSize; }

    bool operator==(const PageWindow& other) const {
        return pageNumber == other.pageNumber && pageSize == other.pageSize;
    }
};

// ── Backend tuning, never changes which rows match ──
struct ExecutionHints {
    bool readOnly = true;
    int64_t fetchSize = defaults::kFetchSize;
    bool cacheable = false;
    // Only set in distinct mode: the backend must not de-duplicate in SQL
    std::optional<bool> passDistinctThrough;
};

struct QueryPlan {
    std::vector<Predicate> predicates;
    std::optional<PageWindow> window;
    bool distinct = false;
    ExecutionHints hints;
};

} // namespace pagedql
