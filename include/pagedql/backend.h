#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/backend.h — Query backend collaborator interfaces
// ═══════════════════════════════════════════════════════════════════
//
//  The resolver never talks to storage directly. A backend session
//  hands out one query object per round-trip:
//
//    auto query = session.buildQuery(entityType);
//    query->addPredicate(p);
//    query->setOffset(10);
//    query->setLimit(10);
//    query->setHint("pagedql.readOnly", true);
//    auto rows = query->execute();
//
//  Predicates are opaque nodes produced by a PredicateCompiler that
//  belongs to the same backend family. A backend rejects nodes it did
//  not produce with BackendError.
//
// ═══════════════════════════════════════════════════════════════════

#include "entity.h"
#include "request.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pagedql {

enum class PredicateKind { Comparison, Logical, Where };

// ── Compiled predicate ──
class PredicateNode {
public:
    PredicateNode(PredicateKind kind, std::string source)
        : kind_(kind), source_(std::move(source)) {}
    virtual ~PredicateNode() = default;

    PredicateKind kind() const { return kind_; }
    // Name of the argument the node was compiled from
    const std::string& source() const { return source_; }

    // Human-readable form for logs and tests
    virtual std::string describe() const = 0;

private:
    PredicateKind kind_;
    std::string source_;
};

using Predicate = std::shared_ptr<const PredicateNode>;

// ── Evaluation scope handed to a compiler ──
//  Field level: path is empty and scope holds every argument by name.
//  Argument level: path is the argument name and scope is its value.
struct PredicateContext {
    const EntityType* entity = nullptr;
    std::string path;
    nlohmann::json scope = nlohmann::json::object();
    bool toManyOptional = true;
};

// ── Turns one argument into a predicate ──
//  Returns std::nullopt when the argument contributes no condition.
//  Throws PredicateError when the argument cannot be compiled.
class PredicateCompiler {
public:
    virtual ~PredicateCompiler() = default;
    virtual std::optional<Predicate> compilePredicate(const PredicateContext& context,
                                                      const Argument& argument) const = 0;
};

// ── Query returning root entity rows ──
class ContentQuery {
public:
    virtual ~ContentQuery() = default;

    virtual void addPredicate(const Predicate& predicate) = 0;
    virtual void setOffset(int64_t offset) = 0;
    virtual void setLimit(int64_t limit) = 0;
    virtual void setDistinct(bool distinct) = 0;
    // Unknown hint names must be accepted and ignored
    virtual void setHint(const std::string& name, const nlohmann::json& value) = 0;
    virtual std::vector<Entity> execute() = 0;
};

// ── Query returning count(root) ──
class CountQuery {
public:
    virtual ~CountQuery() = default;

    virtual void addPredicate(const Predicate& predicate) = 0;
    virtual int64_t executeScalar() = 0;
};

// ── One backend session, owned by the caller for one request ──
class QueryBackend {
public:
    virtual ~QueryBackend() = default;

    virtual std::unique_ptr<ContentQuery> buildQuery(const EntityType& entity) = 0;
    virtual std::unique_ptr<CountQuery> buildCountQuery(const EntityType& entity) = 0;
};

} // namespace pagedql
