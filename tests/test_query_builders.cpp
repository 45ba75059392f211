// ═══════════════════════════════════════════════════════════════════
//  test_query_builders.cpp — Tests for content and count query building
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pagedql/errors.h>
#include <pagedql/query_builders.h>
#include "recording_backend.h"

using namespace pagedql;
using pagedql::testing::RecordingBackend;
using pagedql::testing::RecordingCompiler;
using pagedql::testing::makeEntity;
using pagedql::testing::sources;

class QueryBuildersTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingCompiler> compiler = std::make_shared<RecordingCompiler>();
    PredicateResolver predicates{ReservedNames{}, compiler, compiler};
    ContentQueryBuilder content{predicates, HintNames{}, 1000};
    CountQueryBuilder count{predicates};
    EntityType books{"Book", "books", "id", {"id", "title"}, {}};
    RecordingBackend backend;

    void SetUp() override {
        for (int64_t i = 1; i <= 25; ++i) backend.rows.push_back(makeEntity(i));
    }

    Field request(std::vector<Argument> args = {}) {
        Field f;
        f.name = "Books";
        f.arguments = std::move(args);
        return f;
    }

    std::vector<Entity> fetch(const Field& f, bool distinct, std::optional<PageWindow> window) {
        auto ctx = PredicateResolver::fieldContext(books, f, true);
        return content.fetch(backend, books, content.plan(ctx, f, distinct, window));
    }
};

TEST_F(QueryBuildersTest, NoWindowMeansNoOffsetOrLimit) {
    auto rows = fetch(request({{"title", "x"}}), true, std::nullopt);
    EXPECT_FALSE(backend.log.offset.has_value());
    EXPECT_FALSE(backend.log.limit.has_value());
    EXPECT_EQ(rows.size(), 25u);
}

TEST_F(QueryBuildersTest, SecondPageOfTenIsOffsetTenLimitTen) {
    for (int64_t total : {0, 5, 25, 1000}) {
        backend.rows.resize(static_cast<std::size_t>(std::min<int64_t>(total, 25)));
        backend.countResult = total;
        fetch(request(), true, PageWindow{2, 10});
        ASSERT_TRUE(backend.log.offset.has_value());
        ASSERT_TRUE(backend.log.limit.has_value());
        EXPECT_EQ(*backend.log.offset, 10) << "total=" << total;
        EXPECT_EQ(*backend.log.limit, 10) << "total=" << total;
    }
}

TEST_F(QueryBuildersTest, WindowSelectsRows) {
    auto rows = fetch(request(), false, PageWindow{3, 10});
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows.front().id, 21);
    EXPECT_EQ(rows.back().id, 25);
}

TEST_F(QueryBuildersTest, HintsInDistinctMode) {
    fetch(request(), true, std::nullopt);
    HintNames names;
    EXPECT_EQ(backend.log.distinct, true);
    EXPECT_EQ(backend.log.hints.at(names.readOnly), true);
    EXPECT_EQ(backend.log.hints.at(names.fetchSize), 1000);
    EXPECT_EQ(backend.log.hints.at(names.cacheable), false);
    EXPECT_EQ(backend.log.hints.at(names.passDistinctThrough), false);
}

TEST_F(QueryBuildersTest, NoPassDistinctHintWhenNotDistinct) {
    fetch(request(), false, std::nullopt);
    EXPECT_EQ(backend.log.distinct, false);
    EXPECT_EQ(backend.log.hints.count(HintNames{}.passDistinctThrough), 0u);
    EXPECT_EQ(backend.log.hints.size(), 3u);
}

TEST_F(QueryBuildersTest, CustomHintNamesAndFetchSize) {
    HintNames names;
    names.fetchSize = "org.hibernate.fetchSize";
    ContentQueryBuilder custom(predicates, names, 50);
    auto f = request();
    custom.fetch(backend, books, custom.plan(PredicateResolver::fieldContext(books, f, true), f, true, std::nullopt));
    EXPECT_EQ(backend.log.hints.at("org.hibernate.fetchSize"), 50);
}

TEST_F(QueryBuildersTest, ContentPlanCarriesPredicates) {
    auto f = request({{"title", "x"}, {"distinct", true}, {"where", {{"id", {{"GT", 3}}}}}});
    fetch(f, true, std::nullopt);
    EXPECT_EQ(sources(backend.log.contentPredicates), (std::vector<std::string>{"title", "where"}));
}

TEST_F(QueryBuildersTest, CountCarriesOnlyPredicates) {
    backend.countResult = 42;
    auto f = request({{"title", "x"}});
    auto plan = count.plan(PredicateResolver::fieldContext(books, f, true), f);
    EXPECT_FALSE(plan.window.has_value());
    EXPECT_EQ(count.count(backend, books, plan), 42);
    EXPECT_EQ(sources(backend.log.countPredicates), (std::vector<std::string>{"title"}));
    EXPECT_EQ(backend.log.contentQueries, 0);
}

TEST_F(QueryBuildersTest, BackendErrorsPropagate) {
    backend.failOn = "content";
    EXPECT_THROW(fetch(request(), true, std::nullopt), BackendError);

    backend.failOn = "count";
    auto f = request();
    EXPECT_THROW(count.count(backend, books, count.plan(PredicateResolver::fieldContext(books, f, true), f)),
                 BackendError);
}

namespace {

class NullBackend : public QueryBackend {
public:
    std::unique_ptr<ContentQuery> buildQuery(const EntityType&) override { return nullptr; }
    std::unique_ptr<CountQuery> buildCountQuery(const EntityType&) override { return nullptr; }
};

} // namespace

TEST_F(QueryBuildersTest, MissingQueryObjectIsBackendError) {
    NullBackend none;
    auto f = request();
    auto ctx = PredicateResolver::fieldContext(books, f, true);
    EXPECT_THROW(content.fetch(none, books, content.plan(ctx, f, true, std::nullopt)), BackendError);
    EXPECT_THROW(count.count(none, books, count.plan(ctx, f)), BackendError);
}
