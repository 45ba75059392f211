#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/predicate.h — Argument classification and compilation
// ═══════════════════════════════════════════════════════════════════
//
//  Each argument is classified once by name:
//
//    logical  -> Logical      (structural, no predicate)
//    distinct -> Distinct     (structural, no predicate)
//    where    -> Where        (filter compiler, argument-scoped context)
//    other    -> FieldFilter  (field compiler, field-level context)
//
//  Structural arguments never reach a compiler.
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "config.h"
#include "request.h"
#include <memory>
#include <optional>
#include <vector>

namespace pagedql {

enum class ArgumentKind { Logical, Distinct, Where, FieldFilter };

const char* toString(ArgumentKind kind);

class PredicateResolver {
public:
    PredicateResolver(ReservedNames names,
                      std::shared_ptr<const PredicateCompiler> whereCompiler,
                      std::shared_ptr<const PredicateCompiler> fieldCompiler);

    ArgumentKind classify(const Argument& argument) const;

    // std::nullopt for structural arguments and for compilers that
    // report no condition; compiler errors propagate unchanged
    std::optional<Predicate> resolve(const PredicateContext& fieldContext,
                                     const Argument& argument) const;

    // Every argument of the field, with the empty results dropped
    std::vector<Predicate> resolveAll(const PredicateContext& fieldContext,
                                      const Field& field) const;

    // ── Contexts ──
    static PredicateContext fieldContext(const EntityType& entity, const Field& field,
                                         bool toManyOptional);
    static PredicateContext argumentContext(const PredicateContext& parent,
                                            const Argument& argument);

private:
    ReservedNames names_;
    std::shared_ptr<const PredicateCompiler> whereCompiler_;
    std::shared_ptr<const PredicateCompiler> fieldCompiler_;
};

} // namespace pagedql
