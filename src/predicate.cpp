// ═══════════════════════════════════════════════════════════════════
//  predicate.cpp — Argument classification and compiler dispatch
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/predicate.h"
#include <stdexcept>

namespace pagedql {

const char* toString(ArgumentKind kind) {
    switch (kind) {
        case ArgumentKind::Logical:     return "logical";
        case ArgumentKind::Distinct:    return "distinct";
        case ArgumentKind::Where:       return "where";
        case ArgumentKind::FieldFilter: return "field";
    }
    return "unknown";
}

PredicateResolver::PredicateResolver(ReservedNames names,
                                     std::shared_ptr<const PredicateCompiler> whereCompiler,
                                     std::shared_ptr<const PredicateCompiler> fieldCompiler)
    : names_(std::move(names)),
      whereCompiler_(std::move(whereCompiler)),
      fieldCompiler_(std::move(fieldCompiler)) {
    if (!whereCompiler_ || !fieldCompiler_) {
        throw std::invalid_argument("PredicateResolver requires both a where and a field compiler");
    }
}

ArgumentKind PredicateResolver::classify(const Argument& argument) const {
    if (argument.name == names_.logical) return ArgumentKind::Logical;
    if (argument.name == names_.distinct) return ArgumentKind::Distinct;
    if (argument.name == names_.where) return ArgumentKind::Where;
    return ArgumentKind::FieldFilter;
}

std::optional<Predicate> PredicateResolver::resolve(const PredicateContext& fieldContext,
                                                    const Argument& argument) const {
    std::optional<Predicate> compiled;
    switch (classify(argument)) {
        case ArgumentKind::Logical:
        case ArgumentKind::Distinct:
            return std::nullopt;
        case ArgumentKind::Where:
            compiled = whereCompiler_->compilePredicate(argumentContext(fieldContext, argument), argument);
            break;
        case ArgumentKind::FieldFilter:
            compiled = fieldCompiler_->compilePredicate(fieldContext, argument);
            break;
    }
    if (compiled && !*compiled) return std::nullopt;
    return compiled;
}

std::vector<Predicate> PredicateResolver::resolveAll(const PredicateContext& fieldContext,
                                                     const Field& field) const {
    std::vector<Predicate> predicates;
    predicates.reserve(field.arguments.size());
    for (auto& arg : field.arguments) {
        if (auto p = resolve(fieldContext, arg)) {
            predicates.push_back(std::move(*p));
        }
    }
    return predicates;
}

PredicateContext PredicateResolver::fieldContext(const EntityType& entity, const Field& field,
                                                 bool toManyOptional) {
    PredicateContext ctx;
    ctx.entity = &entity;
    ctx.toManyOptional = toManyOptional;
    for (auto& arg : field.arguments) {
        ctx.scope[arg.name] = arg.value;
    }
    return ctx;
}

PredicateContext PredicateResolver::argumentContext(const PredicateContext& parent,
                                                    const Argument& argument) {
    PredicateContext ctx;
    ctx.entity = parent.entity;
    ctx.toManyOptional = parent.toManyOptional;
    ctx.path = parent.path.empty() ? argument.name : parent.path + "." + argument.name;
    ctx.scope = argument.value;
    return ctx;
}

} // namespace pagedql
