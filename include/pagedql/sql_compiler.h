#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/sql_compiler.h — Predicate compilers for the SQLite backend
// ═══════════════════════════════════════════════════════════════════
//
//  SqlFieldCompiler handles plain field arguments:
//
//    Books(genre: "NOVEL")          -> "root"."genre" = ?
//    Books(genre: null)             -> "root"."genre" IS NULL
//    Books(id: [1, 2])              -> "root"."id" IN (?, ?)
//
//  SqlFilterCompiler handles the where argument:
//
//    where: {
//      title: {LIKE: "%War%"},            column -> operator object
//      genre: "NOVEL",                    scalar shorthand for EQ
//      OR: [{id: {LT: 3}}, {id: 7}],      AND / OR take an object or array
//      NOT: {author_id: {IS_NULL: true}},
//      tags: {tag: {EQ: "classic"}}       relation -> filter on joined table
//    }
//
//  Operators: EQ NE LT LE GT GE LIKE IN NIN IS_NULL
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "database.h"
#include <optional>

namespace pagedql::db {

class SqlFieldCompiler : public PredicateCompiler {
public:
    std::optional<Predicate> compilePredicate(const PredicateContext& context,
                                              const Argument& argument) const override;
};

class SqlFilterCompiler : public PredicateCompiler {
public:
    std::optional<Predicate> compilePredicate(const PredicateContext& context,
                                              const Argument& argument) const override;
};

} // namespace pagedql::db
