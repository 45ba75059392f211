// ═══════════════════════════════════════════════════════════════════
//  resolver.cpp — Content/count orchestration and result assembly
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/resolver.h"
#include "pagedql/console.h"
#include "pagedql/distinct.h"

namespace pagedql {

QueryResolver::QueryResolver(EntityType entity, ResolverConfig config,
                             std::shared_ptr<const PredicateCompiler> whereCompiler,
                             std::shared_ptr<const PredicateCompiler> fieldCompiler)
    : entity_(std::move(entity)),
      config_(std::move(config)),
      defaultDistinct_(config_.defaultDistinct),
      analyzer_(config_.names),
      predicates_(config_.names, std::move(whereCompiler), std::move(fieldCompiler)),
      content_(predicates_, config_.hints, config_.fetchSize),
      count_(predicates_) {}

ResultEnvelope QueryResolver::resolve(const Field& field, QueryBackend& session) const {
    return resolve(analyzer_.analyze(field, defaultDistinct_), session);
}

nlohmann::ordered_json QueryResolver::resolveJson(const Field& field, QueryBackend& session) const {
    auto selection = analyzer_.analyze(field, defaultDistinct_);
    return resolve(selection, session).toJson(config_.names, selection.recordFields);
}

ResultEnvelope QueryResolver::resolve(const Selection& selection, QueryBackend& session) const {
    const Field& request = selection.strippedRequest;
    auto context = PredicateResolver::fieldContext(entity_, request, config_.toManyDefaultOptional);

    std::optional<std::vector<Entity>> records;
    if (selection.wantsRecords) {
        auto plan = content_.plan(context, request, selection.distinct, selection.window);
        auto rows = content_.fetch(session, entity_, plan);
        records = DistinctResolver::apply(std::move(rows), selection.distinct);
    }

    std::optional<int64_t> total;
    if (selection.wantsCount()) {
        if (selection.wantsRecords) {
            total = count_.count(session, entity_, count_.plan(context, request));
        } else {
            // Without a records selection the count ignores every filter argument
            Field unfiltered;
            unfiltered.name = "count";
            auto countContext = PredicateResolver::fieldContext(entity_, unfiltered,
                                                                config_.toManyDefaultOptional);
            total = count_.count(session, entity_, count_.plan(countContext, unfiltered));
        }
    }

    console::debug("resolved", request.responseKey(),
                   "records:", records ? std::to_string(records->size()) : std::string("-"),
                   "total:", total ? std::to_string(*total) : std::string("-"));

    return assembler_.assemble(selection, std::move(records), total);
}

} // namespace pagedql
