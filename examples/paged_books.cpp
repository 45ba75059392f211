// ═══════════════════════════════════════════════════════════════════
//  paged_books.cpp — Paged GraphQL queries over an SQLite catalog
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Describing an entity type with a one-to-many relation
//    • Registering a QueryResolver on a Schema
//    • records / total / pages with a page window and where filters
//    • Distinct handling over a join that duplicates root rows
//
//  Run:  ./paged_books [config.json] ["{ Books { total } }"]
//
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/pagedql.h"
#include <iostream>

using namespace pagedql;

static EntityType bookType() {
    EntityType books;
    books.name = "Book";
    books.table = "books";
    books.columns = {"id", "title", "genre", "author_id"};

    Relation tags;
    tags.name = "tags";
    tags.table = "book_tags";
    tags.foreignKey = "book_id";
    tags.columns = {"tag"};
    books.relations.push_back(tags);
    return books;
}

int main(int argc, char** argv) {
    try {
        ResolverConfig config;
        EntityType books = bookType();
        if (argc > 1) {
            auto doc = readJsonFile(argv[1]);
            config = ResolverConfig::fromJson(doc);
            if (doc.contains("entities") && doc["entities"].is_array() && !doc["entities"].empty()) {
                books = EntityType::fromJson(doc["entities"][0]);
            }
        }

        db::Database database(":memory:");
        database.execMulti(
            "CREATE TABLE books (id INTEGER PRIMARY KEY, title TEXT, genre TEXT, author_id INTEGER);"
            "CREATE TABLE book_tags (id INTEGER PRIMARY KEY, book_id INTEGER, tag TEXT);"
            "INSERT INTO books VALUES (1, 'War and Peace', 'NOVEL', 1);"
            "INSERT INTO books VALUES (2, 'Anna Karenina', 'NOVEL', 1);"
            "INSERT INTO books VALUES (3, 'The Cossacks', 'NOVEL', 1);"
            "INSERT INTO books VALUES (4, 'Notes from Underground', 'NOVEL', 2);"
            "INSERT INTO books VALUES (5, 'The Brothers Karamazov', 'NOVEL', 2);"
            "INSERT INTO books VALUES (6, 'Crime and Punishment', 'NOVEL', 2);"
            "INSERT INTO books VALUES (7, 'Fathers and Sons', 'NOVEL', 3);"
            "INSERT INTO book_tags (book_id, tag) VALUES (1, 'classic'), (1, 'russian'), "
            "(2, 'classic'), (5, 'classic'), (5, 'russian'), (7, 'russian');"
        );

        graphql::Schema schema;
        schema.query("Books", std::make_shared<QueryResolver>(
            books, config,
            std::make_shared<db::SqlFilterCompiler>(),
            std::make_shared<db::SqlFieldCompiler>()));

        db::SqliteBackend session(database, config);

        std::vector<std::string> queries;
        if (argc > 2) {
            queries.push_back(argv[2]);
        } else {
            queries = {
                R"({ Books(page: {start: 1, limit: 3}) { records { id title } total pages } })",
                R"({ Books(where: {tags: {tag: {IN: ["classic", "russian"]}}}) { records { id title } total } })",
                R"({ Books(where: {title: {LIKE: "%and%"}}) { total } })",
                R"({ Books(page: {start: 0, limit: 3}) { records { id } } })",
            };
        }

        for (auto& q : queries) {
            console::info("query:", q);
            std::cout << schema.execute(q, session).dump(2) << std::endl;
        }
    } catch (const Error& e) {
        console::error(e.kindName(), e.what());
        return 1;
    }
    return 0;
}
