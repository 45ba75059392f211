// ═══════════════════════════════════════════════════════════════════
//  test_distinct.cpp — Tests for in-order de-duplication of fetched rows
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pagedql/distinct.h>
#include "recording_backend.h"
#include <unordered_set>

using namespace pagedql;
using pagedql::testing::makeEntity;

namespace {

std::vector<Entity> joinedRows() {
    // Shape of a one-to-many join: book 1 and 5 appear once per tag
    return {
        makeEntity(1), makeEntity(1), makeEntity(2),
        makeEntity(5), makeEntity(5), makeEntity(1), makeEntity(7),
    };
}

std::vector<int64_t> ids(const std::vector<Entity>& rows) {
    std::vector<int64_t> out;
    for (auto& e : rows) out.push_back(e.id.get<int64_t>());
    return out;
}

} // namespace

TEST(DistinctTest, DistinctKeepsFirstOccurrenceOrder) {
    auto raw = joinedRows();
    auto result = DistinctResolver::apply(raw, true);
    EXPECT_LE(result.size(), raw.size());
    EXPECT_EQ(ids(result), (std::vector<int64_t>{1, 2, 5, 7}));

    std::unordered_set<Entity> seen;
    for (auto& e : result) {
        EXPECT_TRUE(seen.insert(e).second) << "duplicate id " << e.id.dump();
    }
}

TEST(DistinctTest, NonDistinctIsIdentity) {
    auto raw = joinedRows();
    auto result = DistinctResolver::apply(raw, false);
    ASSERT_EQ(result.size(), raw.size());
    EXPECT_EQ(ids(result), ids(raw));
}

TEST(DistinctTest, EqualIdsOfDifferentTypesAreKept) {
    auto book = makeEntity(1);
    Entity author{"Author", 1, {{"id", 1}}};
    auto result = DistinctResolver::apply({book, author, book}, true);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].type, "Book");
    EXPECT_EQ(result[1].type, "Author");
}

TEST(DistinctTest, EmptyInput) {
    EXPECT_TRUE(DistinctResolver::apply({}, true).empty());
    EXPECT_TRUE(DistinctResolver::apply({}, false).empty());
}

TEST(DistinctTest, GenericHelperWorksOnPlainValues) {
    EXPECT_EQ(distinctInOrder(std::vector<std::string>{"b", "a", "b", "c", "a"}),
              (std::vector<std::string>{"b", "a", "c"}));
}
