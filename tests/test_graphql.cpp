// ═══════════════════════════════════════════════════════════════════
//  test_graphql.cpp — GraphQL parsing and paged schema execution tests
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "pagedql/database.h"
#include "pagedql/graphql.h"
#include "pagedql/sql_compiler.h"
#include "recording_backend.h"

using namespace pagedql;
using namespace pagedql::graphql;

// ═══════════════════════════════════════════
//  Parser Tests
// ═══════════════════════════════════════════

TEST(GraphQLParserTest, SimpleQuery) {
    detail::GraphQLParser parser("{ Books { total } }");
    auto parsed = parser.parse();

    EXPECT_EQ(parsed.operationType, "query");
    ASSERT_EQ(parsed.selections.size(), 1u);
    EXPECT_EQ(parsed.selections[0].name, "Books");
    ASSERT_EQ(parsed.selections[0].selections.size(), 1u);
    EXPECT_EQ(parsed.selections[0].selections[0].name, "total");
}

TEST(GraphQLParserTest, ExplicitQueryKeywordAndName) {
    auto parsed = parse("query BookPage { Books { total } Authors { pages } }");
    EXPECT_EQ(parsed.operationType, "query");
    EXPECT_EQ(parsed.operationName, "BookPage");
    ASSERT_EQ(parsed.selections.size(), 2u);
    EXPECT_EQ(parsed.selections[1].name, "Authors");
}

TEST(GraphQLParserTest, MutationKeyword) {
    auto parsed = parse("mutation { createBook }");
    EXPECT_EQ(parsed.operationType, "mutation");
}

TEST(GraphQLParserTest, ArgumentsKeepOrderAndTypes) {
    auto parsed = parse(R"({
        Books(title: "War", page: {start: 2, limit: 10}, distinct: false,
              genre: NOVEL, author_id: null, id: [1, 2], price: 9.5) { total }
    })");
    auto& args = parsed.selections[0].arguments;
    ASSERT_EQ(args.size(), 7u);
    EXPECT_EQ(args[0].name, "title");
    EXPECT_EQ(args[0].value, "War");
    EXPECT_EQ(args[1].name, "page");
    EXPECT_EQ(args[1].value, (nlohmann::json{{"start", 2}, {"limit", 10}}));
    EXPECT_TRUE(args[1].value["start"].is_number_integer());
    EXPECT_EQ(args[2].value, false);
    EXPECT_EQ(args[3].value, "NOVEL");
    EXPECT_TRUE(args[4].value.is_null());
    EXPECT_EQ(args[5].value, (nlohmann::json{1, 2}));
    EXPECT_DOUBLE_EQ(args[6].value.get<double>(), 9.5);
}

TEST(GraphQLParserTest, NestedSelectionsAndAliases) {
    auto parsed = parse(R"({
        firstPage: Books(page: {start: 1, limit: 5}) {
            records { id label: title }
            total
        }
    })");
    ASSERT_EQ(parsed.selections.size(), 1u);
    auto& books = parsed.selections[0];
    EXPECT_EQ(books.alias, "firstPage");
    EXPECT_EQ(books.name, "Books");
    EXPECT_EQ(books.responseKey(), "firstPage");

    auto* records = books.selection("records");
    ASSERT_NE(records, nullptr);
    ASSERT_EQ(records->selections.size(), 2u);
    EXPECT_EQ(records->selections[1].alias, "label");
    EXPECT_EQ(records->selections[1].name, "title");
}

TEST(GraphQLParserTest, CommentsAndVariables) {
    auto parsed = parse(R"(
        # first page of novels
        query Page($page: PageInput, $genre: String) {
            Books(page: $page, genre: $genre) { total }
        }
    )", {{"page", {{"start", 1}, {"limit", 3}}}, {"genre", "NOVEL"}});

    auto& args = parsed.selections[0].arguments;
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0].value["limit"], 3);
    EXPECT_EQ(args[1].value, "NOVEL");
}

TEST(GraphQLParserTest, Errors) {
    EXPECT_THROW(parse("subscription { Books }"), ParseError);
    EXPECT_THROW(parse("{ Books(page: $missing) { total } }"), ParseError);
    EXPECT_THROW(parse("{ Books { total }"), ParseError);
    EXPECT_THROW(parse("{ Books(title: \"War) { total } }"), ParseError);
    EXPECT_THROW(parse("{ Books } }"), ParseError);
    EXPECT_THROW(parse("{ Books(id: 99999999999999999999) }"), ParseError);
}

TEST(GraphQLParserTest, NumbersWithoutDigitsAreParseErrors) {
    EXPECT_THROW(parse("{ Books(page: {start: -., limit: 2}) { total } }"), ParseError);
    EXPECT_THROW(parse("{ Books(id: .) { total } }"), ParseError);
    EXPECT_THROW(parse("{ Books(id: -) { total } }"), ParseError);
    EXPECT_DOUBLE_EQ(parse("{ Books(price: -.5) { total } }")
                         .selections[0].arguments[0].value.get<double>(), -0.5);
}

// ═══════════════════════════════════════════
//  Schema & Execution Tests
// ═══════════════════════════════════════════

class SchemaTest : public ::testing::Test {
protected:
    db::Database database{":memory:"};
    db::SqliteBackend session{database};
    Schema schema;

    void SetUp() override {
        database.execMulti(
            "CREATE TABLE books (id INTEGER PRIMARY KEY, title TEXT, genre TEXT);"
            "INSERT INTO books VALUES (1, 'A', 'NOVEL'), (2, 'B', 'NOVEL'), (3, 'C', 'POETRY');"
        );
        EntityType books;
        books.name = "Book";
        books.table = "books";
        books.columns = {"id", "title", "genre"};
        schema.query("Books", std::make_shared<QueryResolver>(
            books, ResolverConfig{},
            std::make_shared<db::SqlFilterCompiler>(),
            std::make_shared<db::SqlFieldCompiler>()));
    }
};

TEST_F(SchemaTest, PagedQuery) {
    auto response = schema.execute(
        "{ Books(page: {start: 1, limit: 2}) { records { id title } total pages } }", session);

    EXPECT_FALSE(response.contains("errors"));
    EXPECT_EQ(response["data"]["Books"].dump(),
        R"({"records":[{"id":1,"title":"A"},{"id":2,"title":"B"}],"total":3,"pages":2})");
}

TEST_F(SchemaTest, AliasesAndFilters) {
    auto response = schema.execute(R"({
        novels: Books(where: {genre: {EQ: "NOVEL"}}) { records { title } total }
        everything: Books { total }
    })", session);

    EXPECT_EQ(response["data"]["novels"]["total"], 2);
    EXPECT_EQ(response["data"]["novels"]["records"].size(), 2u);
    EXPECT_EQ(response["data"]["everything"]["total"], 3);
}

TEST_F(SchemaTest, VariablesReachResolver) {
    auto response = schema.execute(
        "query($p: PageInput) { Books(page: $p) { records { id } pages } }", session,
        {{"p", {{"start", 2}, {"limit", 2}}}});
    EXPECT_EQ(response["data"]["Books"].dump(), R"({"records":[{"id":3}],"pages":2})");
}

TEST_F(SchemaTest, ErrorsCarryClassification) {
    auto response = schema.execute(R"({
        bad: Books(page: {start: 0, limit: 10}) { records { id } }
        worse: Books(where: {isbn: {EQ: "x"}}) { records { id } }
        good: Books { total }
    })", session);

    ASSERT_TRUE(response.contains("errors"));
    auto& errors = response["errors"];
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0]["extensions"]["classification"], "ArgumentError");
    EXPECT_EQ(errors[0]["path"][0], "bad");
    EXPECT_EQ(errors[1]["extensions"]["classification"], "PredicateError");
    EXPECT_EQ(errors[1]["path"][0], "worse");

    EXPECT_TRUE(response["data"]["bad"].is_null());
    EXPECT_TRUE(response["data"]["worse"].is_null());
    EXPECT_EQ(response["data"]["good"]["total"], 3);
}

TEST_F(SchemaTest, UnknownFieldAndMutation) {
    auto unknown = schema.execute("{ Authors { total } }", session);
    EXPECT_EQ(unknown["errors"][0]["extensions"]["classification"], "ValidationError");

    auto mutation = schema.execute("mutation { Books { total } }", session);
    EXPECT_EQ(mutation["errors"][0]["extensions"]["classification"], "ValidationError");
}

TEST_F(SchemaTest, ParseErrorHasNullData) {
    auto response = schema.execute("{ Books { total }", session);
    EXPECT_TRUE(response["data"].is_null());
    EXPECT_EQ(response["errors"][0]["extensions"]["classification"], "ParseError");
}

TEST_F(SchemaTest, MalformedNumberIsParseErrorResponse) {
    nlohmann::ordered_json response;
    EXPECT_NO_THROW(response = schema.execute(
        "{ Books(page: {start: -., limit: 2}) { total } }", session));
    EXPECT_TRUE(response["data"].is_null());
    EXPECT_EQ(response["errors"][0]["extensions"]["classification"], "ParseError");
}

TEST_F(SchemaTest, BackendErrorsReported) {
    pagedql::testing::RecordingBackend failing;
    failing.failOn = "count";
    auto response = schema.execute("{ Books { total } }", failing);
    EXPECT_EQ(response["errors"][0]["extensions"]["classification"], "BackendError");
}

TEST(SchemaRegistrationTest, RequiresResolver) {
    Schema schema;
    EXPECT_THROW(schema.query("Books", nullptr), std::invalid_argument);
    EXPECT_EQ(schema.resolver("Books"), nullptr);
}
