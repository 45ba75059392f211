#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/pagedql.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "pagedql/pagedql.h"
//  using namespace pagedql;
//
//  This single include gives you:
//    • QueryResolver, ResultEnvelope, ResolverConfig
//    • graphql::Schema, graphql::parse()
//    • db::Database, db::SqliteBackend, db::SqlFilterCompiler
//    • console::log(), debug(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "errors.h"
#include "console.h"
#include "config.h"
#include "request.h"
#include "entity.h"
#include "backend.h"

// Resolution
#include "selection.h"
#include "predicate.h"
#include "query_plan.h"
#include "query_builders.h"
#include "distinct.h"
#include "result.h"
#include "resolver.h"

// Request layer and SQLite backend
#include "graphql.h"
#include "database.h"
#include "sql_compiler.h"
