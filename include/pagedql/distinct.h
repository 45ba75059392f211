#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/distinct.h — In-memory de-duplication of fetched rows
// ═══════════════════════════════════════════════════════════════════
//
//  Runs on the page the backend already limited, so a page may hold
//  fewer than pageSize records when the join produced duplicates.
//  total and pages are not adjusted.
//
// ═══════════════════════════════════════════════════════════════════

#include "entity.h"
#include <functional>
#include <unordered_set>
#include <vector>

namespace pagedql {

// Keeps the first occurrence of each element, preserving order
template <typename T, typename Hash = std::hash<T>, typename Eq = std::equal_to<T>>
std::vector<T> distinctInOrder(std::vector<T> items) {
    std::unordered_set<T, Hash, Eq> seen;
    seen.reserve(items.size());
    std::vector<T> out;
    out.reserve(items.size());
    for (auto& item : items) {
        if (seen.insert(item).second) {
            out.push_back(std::move(item));
        }
    }
    return out;
}

class DistinctResolver {
public:
    static std::vector<Entity> apply(std::vector<Entity> rows, bool distinct) {
        if (!distinct) return rows;
        return distinctInOrder(std::move(rows));
    }
};

} // namespace pagedql
