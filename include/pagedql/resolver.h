#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/resolver.h — Paged query resolution for one entity type
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto where = std::make_shared<db::SqlFilterCompiler>();
//    auto field = std::make_shared<db::SqlFieldCompiler>();
//    QueryResolver books(bookType, config, where, field);
//
//    db::SqliteBackend session(database, config);
//    ResultEnvelope result = books.resolve(request, session);
//
//  One call performs at most two backend round-trips: the content
//  query when records are selected, then the count query when total
//  or pages are selected. The session belongs to the caller.
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "config.h"
#include "entity.h"
#include "predicate.h"
#include "query_builders.h"
#include "request.h"
#include "result.h"
#include "selection.h"
#include <memory>

namespace pagedql {

class QueryResolver {
public:
    QueryResolver(EntityType entity, ResolverConfig config,
                  std::shared_ptr<const PredicateCompiler> whereCompiler,
                  std::shared_ptr<const PredicateCompiler> fieldCompiler);

    // Builders hold references into this object
    QueryResolver(const QueryResolver&) = delete;
    QueryResolver& operator=(const QueryResolver&) = delete;

    ResultEnvelope resolve(const Field& field, QueryBackend& session) const;

    // resolve() rendered with the records sub-selection as projection
    nlohmann::ordered_json resolveJson(const Field& field, QueryBackend& session) const;

    // ── Default distinct mode, used when the request has no distinct argument ──
    bool isDefaultDistinct() const { return defaultDistinct_; }
    void setDefaultDistinct(bool distinct) { defaultDistinct_ = distinct; }

    const EntityType& entity() const { return entity_; }
    const ResolverConfig& config() const { return config_; }

private:
    EntityType entity_;
    ResolverConfig config_;
    bool defaultDistinct_;

    SelectionAnalyzer analyzer_;
    PredicateResolver predicates_;
    ContentQueryBuilder content_;
    CountQueryBuilder count_;
    ResultAssembler assembler_;

    ResultEnvelope resolve(const Selection& selection, QueryBackend& session) const;
};

} // namespace pagedql
