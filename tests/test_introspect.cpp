#include "catch.hpp"
#include "tabula/ddl_visitor.hpp"
#include "tabula/introspect.hpp"
#include "tabula/runner.hpp"
#include "tabula/sqlconnection.hpp"

using namespace tabula;

TEST_CASE("SQLite catalog reads back as a snapshot", "[introspect]") {
    PSQLConnection conn = make_sqlite_connection();
    conn->connect(":memory:");
    Executor ex = conn->executor();

    SchemaSnapshot declared = SchemaSnapshot::parse(R"({
      "tables": {
        "users": {
          "columns": {
            "id":    { "type": "integer", "primary": true },
            "email": { "type": "text", "unique": true },
            "age":   { "type": "integer", "nullable": true },
            "score": { "type": "float", "default": "0" }
          }
        },
        "posts": {
          "columns": {
            "id":     { "type": "integer", "primary": true },
            "author": { "type": "integer" },
            "title":  { "type": "text" }
          },
          "indexes": [ { "columns": ["title"] } ],
          "foreignKeys": [ { "column": "author", "targetTable": "users", "targetColumn": "id" } ]
        }
      }
    })");
    for (const auto& stmt : generate_migration_statements(compute_diff({}, declared), declared, sqlite_dialect()))
        ex.execute(stmt);
    MigrationRunner(ex).create_history_table();

    SchemaSnapshot live = introspect(ex);
    REQUIRE(live.tables.keys() == std::vector<std::string>{"users", "posts"});

    const TableSnapshot& users = *live.tables.find("users");
    REQUIRE(users.columns.keys() == std::vector<std::string>{"id", "email", "age", "score"});
    REQUIRE(users.columns.find("id")->primary);
    REQUIRE(users.columns.find("id")->type == "integer");
    REQUIRE(users.columns.find("email")->unique);
    REQUIRE_FALSE(users.columns.find("email")->nullable);
    REQUIRE(users.columns.find("age")->nullable);
    REQUIRE(users.columns.find("score")->type == "float");
    REQUIRE(users.columns.find("score")->default_value == std::optional<std::string>("0"));

    const TableSnapshot& posts = *live.tables.find("posts");
    REQUIRE(posts.indexes.size() == 1);
    REQUIRE(posts.indexes[0].columns == std::vector<std::string>{"title"});
    REQUIRE(posts.indexes[0].name == std::optional<std::string>("idx_posts_title"));
    REQUIRE(posts.foreign_keys == std::vector<ForeignKeySnapshot>{{"author", "users", "id"}});

    REQUIRE(compute_diff(declared, live).empty());
}
