#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/query_builders.h — Content and count query construction
// ═══════════════════════════════════════════════════════════════════
//
//  Both builders compile their predicates independently from the same
//  arguments; the count query never carries a window or hints.
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "config.h"
#include "predicate.h"
#include "query_plan.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace pagedql {

class ContentQueryBuilder {
public:
    ContentQueryBuilder(const PredicateResolver& predicates, HintNames hintNames, int64_t fetchSize)
        : predicates_(predicates), hintNames_(std::move(hintNames)), fetchSize_(fetchSize) {}

    QueryPlan plan(const PredicateContext& context, const Field& strippedRequest,
                   bool distinct, const std::optional<PageWindow>& window) const;

    // Builds the backend query from the plan and runs it; rows come back in backend order
    std::vector<Entity> fetch(QueryBackend& backend, const EntityType& entity,
                              const QueryPlan& plan) const;

private:
    const PredicateResolver& predicates_;
    HintNames hintNames_;
    int64_t fetchSize_;
};

class CountQueryBuilder {
public:
    explicit CountQueryBuilder(const PredicateResolver& predicates) : predicates_(predicates) {}

    // Predicates only: no window, no distinct, no hints
    QueryPlan plan(const PredicateContext& context, const Field& countRequest) const;

    int64_t count(QueryBackend& backend, const EntityType& entity, const QueryPlan& plan) const;

private:
    const PredicateResolver& predicates_;
};

} // namespace pagedql
