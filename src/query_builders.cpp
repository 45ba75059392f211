// ═══════════════════════════════════════════════════════════════════
//  query_builders.cpp — Content and count query construction
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/query_builders.h"
#include "pagedql/console.h"
#include "pagedql/errors.h"

namespace pagedql {

// ═══════════════════════════════════════════
//  ContentQueryBuilder
// ═══════════════════════════════════════════

QueryPlan ContentQueryBuilder::plan(const PredicateContext& context, const Field& strippedRequest,
                                    bool distinct, const std::optional<PageWindow>& window) const {
    QueryPlan plan;
    plan.predicates = predicates_.resolveAll(context, strippedRequest);
    plan.window = window;
    plan.distinct = distinct;

    plan.hints.readOnly = true;
    plan.hints.fetchSize = fetchSize_;
    plan.hints.cacheable = false;
    // Distinct mode de-duplicates after the fetch, never in SQL
    if (distinct) plan.hints.passDistinctThrough = false;

    return plan;
}

std::vector<Entity> ContentQueryBuilder::fetch(QueryBackend& backend, const EntityType& entity,
                                               const QueryPlan& plan) const {
    auto query = backend.buildQuery(entity);
    if (!query) {
        throw BackendError("Backend returned no content query for '" + entity.name + "'");
    }

    for (auto& p : plan.predicates) {
        query->addPredicate(p);
    }

    if (plan.window) {
        query->setLimit(plan.window->limit());
        query->setOffset(plan.window->offset());
    }

    query->setDistinct(plan.distinct);
    query->setHint(hintNames_.readOnly, plan.hints.readOnly);
    query->setHint(hintNames_.fetchSize, plan.hints.fetchSize);
    query->setHint(hintNames_.cacheable, plan.hints.cacheable);
    if (plan.hints.passDistinctThrough) {
        query->setHint(hintNames_.passDistinctThrough, *plan.hints.passDistinctThrough);
    }

    if (console::enabled(console::Level::Debug)) {
        console::debug("content query", entity.name,
                       "predicates:", plan.predicates.size(),
                       "offset:", plan.window ? plan.window->offset() : 0,
                       "limit:", plan.window ? std::to_string(plan.window->limit()) : std::string("none"),
                       "distinct:", plan.distinct);
    }

    auto rows = query->execute();
    console::debug("content query", entity.name, "fetched", rows.size(), "rows");
    return rows;
}

// ═══════════════════════════════════════════
//  CountQueryBuilder
// ═══════════════════════════════════════════

QueryPlan CountQueryBuilder::plan(const PredicateContext& context, const Field& countRequest) const {
    QueryPlan plan;
    plan.predicates = predicates_.resolveAll(context, countRequest);
    return plan;
}

int64_t CountQueryBuilder::count(QueryBackend& backend, const EntityType& entity,
                                 const QueryPlan& plan) const {
    auto query = backend.buildCountQuery(entity);
    if (!query) {
        throw BackendError("Backend returned no count query for '" + entity.name + "'");
    }

    for (auto& p : plan.predicates) {
        query->addPredicate(p);
    }

    console::debug("count query", entity.name, "predicates:", plan.predicates.size());
    auto total = query->executeScalar();
    console::debug("count query", entity.name, "total:", total);
    return total;
}

} // namespace pagedql
