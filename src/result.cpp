// ═══════════════════════════════════════════════════════════════════
//  result.cpp — Result envelope assembly and rendering
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/result.h"
#include <cmath>

namespace pagedql {

int64_t ResultAssembler::pageCount(int64_t total, const std::optional<PageWindow>& window) {
    if (total <= 0) return 0;
    if (!window) return 1;
    return static_cast<int64_t>(std::ceil(static_cast<double>(total) / static_cast<double>(window->pageSize)));
}

ResultEnvelope ResultAssembler::assemble(const Selection& selection,
                                         std::optional<std::vector<Entity>> records,
                                         std::optional<int64_t> total) const {
    ResultEnvelope envelope;
    if (selection.wantsRecords) {
        envelope.records = records ? std::move(*records) : std::vector<Entity>{};
    }
    if (selection.wantsTotal) {
        envelope.total = total.value_or(0);
    }
    if (selection.wantsPages) {
        envelope.pages = pageCount(total.value_or(0), selection.window);
    }
    return envelope;
}

nlohmann::ordered_json entityToJson(const Entity& entity, const std::vector<Field>& projection) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    if (projection.empty()) {
        for (auto& [key, value] : entity.attributes.items()) {
            out[key] = value;
        }
        return out;
    }
    for (auto& sel : projection) {
        auto it = entity.attributes.find(sel.name);
        if (it != entity.attributes.end()) {
            out[sel.responseKey()] = *it;
        }
    }
    return out;
}

nlohmann::ordered_json ResultEnvelope::toJson(const ReservedNames& names,
                                              const std::vector<Field>& projection) const {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    if (records) {
        nlohmann::ordered_json arr = nlohmann::ordered_json::array();
        for (auto& e : *records) {
            arr.push_back(entityToJson(e, projection));
        }
        out[names.records] = std::move(arr);
    }
    if (total) out[names.total] = *total;
    if (pages) out[names.pages] = *pages;
    return out;
}

} // namespace pagedql
