// ═══════════════════════════════════════════════════════════════════
//  test_predicate.cpp — Tests for argument classification and dispatch
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pagedql/errors.h>
#include <pagedql/predicate.h>
#include "recording_backend.h"

using namespace pagedql;
using pagedql::testing::RecordingCompiler;
using pagedql::testing::sources;

class PredicateResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingCompiler> where = std::make_shared<RecordingCompiler>(PredicateKind::Where);
    std::shared_ptr<RecordingCompiler> fields = std::make_shared<RecordingCompiler>();
    PredicateResolver resolver{ReservedNames{}, where, fields};
    EntityType books{"Book", "books", "id", {"id", "title", "genre"}, {}};

    Field request(std::vector<Argument> args) {
        Field f;
        f.name = "Books";
        f.arguments = std::move(args);
        return f;
    }
};

TEST_F(PredicateResolverTest, ClassifiesByReservedName) {
    EXPECT_EQ(resolver.classify({"logical", "AND"}), ArgumentKind::Logical);
    EXPECT_EQ(resolver.classify({"distinct", true}), ArgumentKind::Distinct);
    EXPECT_EQ(resolver.classify({"where", nlohmann::json::object()}), ArgumentKind::Where);
    EXPECT_EQ(resolver.classify({"title", "War"}), ArgumentKind::FieldFilter);
    EXPECT_STREQ(toString(ArgumentKind::FieldFilter), "field");
}

TEST_F(PredicateResolverTest, ReservedArgumentsNeverReachCompilers) {
    auto field = request({
        {"logical", "OR"},
        {"title", "War"},
        {"distinct", false},
        {"where", {{"genre", {{"EQ", "NOVEL"}}}}},
        {"genre", "NOVEL"},
    });
    auto ctx = PredicateResolver::fieldContext(books, field, true);
    auto predicates = resolver.resolveAll(ctx, field);

    EXPECT_EQ(sources(predicates), (std::vector<std::string>{"title", "where", "genre"}));
    EXPECT_EQ(fields->seen, (std::vector<std::string>{"title", "genre"}));
    EXPECT_EQ(where->seen, (std::vector<std::string>{"where"}));
    for (auto& p : predicates) {
        EXPECT_NE(p->source(), "logical");
        EXPECT_NE(p->source(), "distinct");
        EXPECT_NE(p->source(), "page");
    }
}

TEST_F(PredicateResolverTest, WhereGetsArgumentContextFieldGetsFieldContext) {
    auto field = request({{"title", "War"}, {"where", {{"genre", {{"EQ", "NOVEL"}}}}}});
    auto ctx = PredicateResolver::fieldContext(books, field, false);
    resolver.resolveAll(ctx, field);

    ASSERT_EQ(fields->contexts.size(), 1u);
    EXPECT_EQ(fields->contexts[0].path, "");
    EXPECT_EQ(fields->contexts[0].scope["title"], "War");
    EXPECT_EQ(fields->contexts[0].entity, &books);

    ASSERT_EQ(where->contexts.size(), 1u);
    EXPECT_EQ(where->contexts[0].path, "where");
    EXPECT_EQ(where->contexts[0].scope, (nlohmann::json{{"genre", {{"EQ", "NOVEL"}}}}));
    EXPECT_FALSE(where->contexts[0].toManyOptional);
}

TEST_F(PredicateResolverTest, NoPredicateResultsAreDropped) {
    fields->noneFor = "title";
    auto field = request({{"title", nullptr}, {"genre", "NOVEL"}});
    auto predicates = resolver.resolveAll(PredicateResolver::fieldContext(books, field, true), field);
    EXPECT_EQ(sources(predicates), (std::vector<std::string>{"genre"}));
}

TEST_F(PredicateResolverTest, CompilerErrorsPropagate) {
    where->failOn = "where";
    auto field = request({{"where", {{"genre", {{"BETWEEN", 1}}}}}});
    EXPECT_THROW(resolver.resolveAll(PredicateResolver::fieldContext(books, field, true), field),
                 PredicateError);
}

TEST_F(PredicateResolverTest, CustomLogicalNameIsStructural) {
    ReservedNames names;
    names.logical = "op";
    PredicateResolver custom(names, where, fields);
    auto field = request({{"op", "AND"}, {"logical", "x"}});
    auto predicates = custom.resolveAll(PredicateResolver::fieldContext(books, field, true), field);
    EXPECT_EQ(sources(predicates), (std::vector<std::string>{"logical"}));
}

TEST(PredicateResolverConstructionTest, RequiresBothCompilers) {
    auto c = std::make_shared<RecordingCompiler>();
    EXPECT_THROW(PredicateResolver(ReservedNames{}, nullptr, c), std::invalid_argument);
    EXPECT_THROW(PredicateResolver(ReservedNames{}, c, nullptr), std::invalid_argument);
}

TEST(PredicateContextTest, NestedArgumentPathIsDotted) {
    PredicateContext parent;
    parent.path = "where";
    auto child = PredicateResolver::argumentContext(parent, {"tags", {{"tag", "x"}}});
    EXPECT_EQ(child.path, "where.tags");
    EXPECT_EQ(child.scope, (nlohmann::json{{"tag", "x"}}));
}
