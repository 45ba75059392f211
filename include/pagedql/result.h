#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/result.h — Result envelope and page arithmetic
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "entity.h"
#include "query_plan.h"
#include "request.h"
#include "selection.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace pagedql {

// ── Up to three sections; unselected ones stay empty ──
struct ResultEnvelope {
    std::optional<std::vector<Entity>> records;
    std::optional<int64_t> total;
    std::optional<int64_t> pages;

    // Ordered records -> total -> pages. With a non-empty projection each
    // record only carries the listed attributes.
    nlohmann::ordered_json toJson(const ReservedNames& names,
                                  const std::vector<Field>& projection = {}) const;
};

nlohmann::ordered_json entityToJson(const Entity& entity, const std::vector<Field>& projection);

class ResultAssembler {
public:
    // ceil(total / pageSize); without a window 1 for a non-empty set, else 0
    static int64_t pageCount(int64_t total, const std::optional<PageWindow>& window);

    ResultEnvelope assemble(const Selection& selection,
                            std::optional<std::vector<Entity>> records,
                            std::optional<int64_t> total) const;
};

} // namespace pagedql
