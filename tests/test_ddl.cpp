#include "catch.hpp"
#include "tabula/ddl_visitor.hpp"
#include "tabula/errors.hpp"
#include "fake_sql.hpp"

using namespace tabula;

static SchemaSnapshot blog_schema() {
    return SchemaSnapshot::parse(R"({
      "tables": {
        "users": {
          "columns": {
            "id":        { "type": "uuid", "primary": true },
            "email":     { "type": "text", "unique": true },
            "role":      { "type": "userRole", "default": "'member'" },
            "createdAt": { "type": "timestamp", "default": "now()" }
          },
          "indexes": [ { "columns": ["createdAt"] } ]
        },
        "posts": {
          "columns": {
            "id":       { "type": "uuid", "primary": true },
            "authorId": { "type": "uuid", "nullable": true }
          },
          "foreignKeys": [ { "column": "authorId", "targetTable": "users", "targetColumn": "id" } ]
        }
      },
      "enums": { "userRole": ["member", "admin"] }
    })");
}

TEST_CASE("Full schema on Postgres", "[ddl]") {
    auto stmts = generate_migration_statements(compute_diff({}, blog_schema()), blog_schema(), pg_dialect());
    REQUIRE(stmts.size() == 4);
    REQUIRE(stmts[0] == "CREATE TYPE \"user_role\" AS ENUM ('member', 'admin');");
    REQUIRE(stmts[1] ==
            "CREATE TABLE \"users\" (\n"
            "  \"id\" uuid NOT NULL,\n"
            "  \"email\" text NOT NULL UNIQUE,\n"
            "  \"role\" \"user_role\" NOT NULL DEFAULT 'member',\n"
            "  \"created_at\" timestamp NOT NULL DEFAULT now(),\n"
            "  PRIMARY KEY (\"id\")\n"
            ");");
    REQUIRE(stmts[2] == "CREATE INDEX \"idx_users_created_at\" ON \"users\" (\"created_at\");");
    REQUIRE(contains(stmts[3], "FOREIGN KEY (\"author_id\") REFERENCES \"users\" (\"id\")"));
    REQUIRE(contains(stmts[3], "\"author_id\" uuid,"));
}

TEST_CASE("Full schema on SQLite uses CHECK for enums", "[ddl]") {
    auto stmts = generate_migration_statements(compute_diff({}, blog_schema()), blog_schema(), sqlite_dialect());
    REQUIRE(stmts.size() == 3);
    REQUIRE(contains(stmts[0], "\"id\" TEXT NOT NULL"));
    REQUIRE(contains(stmts[0], "\"role\" TEXT NOT NULL DEFAULT 'member' CHECK(\"role\" IN ('member', 'admin'))"));
    REQUIRE(contains(stmts[0], "\"created_at\" TEXT NOT NULL DEFAULT (datetime('now'))"));
}

TEST_CASE("Literal values are escaped", "[ddl]") {
    SchemaSnapshot s;
    s.enums.set("mood", {"it's fine"});
    auto stmts = generate_migration_statements(DiffResult{EnumAdded{"mood"}}, s, pg_dialect());
    REQUIRE(stmts == std::vector<std::string>{"CREATE TYPE \"mood\" AS ENUM ('it''s fine');"});
}

TEST_CASE("Column statements", "[ddl]") {
    SchemaSnapshot target = blog_schema();
    DDLVisitor pg(pg_dialect(), target);

    REQUIRE(pg(ColumnAdded{"users", "email"}) ==
            std::vector<std::string>{"ALTER TABLE \"users\" ADD COLUMN \"email\" text NOT NULL UNIQUE;"});
    REQUIRE(pg(ColumnRemoved{"users", "nickName"}) ==
            std::vector<std::string>{"ALTER TABLE \"users\" DROP COLUMN \"nick_name\";"});
    REQUIRE(pg(ColumnRenamed{"users", "name", "fullName", 1.0}) ==
            std::vector<std::string>{"ALTER TABLE \"users\" RENAME COLUMN \"name\" TO \"full_name\";"});

    ColumnAltered alt;
    alt.table = "users";
    alt.column = "age";
    alt.old_type = "integer";
    alt.new_type = "bigint";
    alt.old_nullable = true;
    alt.new_nullable = false;
    alt.default_changed = true;
    alt.old_default = "0";
    REQUIRE(pg(alt) == std::vector<std::string>{
        "ALTER TABLE \"users\" ALTER COLUMN \"age\" TYPE bigint;",
        "ALTER TABLE \"users\" ALTER COLUMN \"age\" SET NOT NULL;",
        "ALTER TABLE \"users\" ALTER COLUMN \"age\" DROP DEFAULT;",
    });

    DDLVisitor lite(sqlite_dialect(), target);
    REQUIRE_THROWS_AS(lite(alt), MigrationError);
}

TEST_CASE("Enum value removal recreates the type", "[ddl]") {
    SchemaSnapshot target = blog_schema();
    target.enums.set("userRole", {"member"});
    DDLVisitor pg(pg_dialect(), target);

    auto stmts = pg(EnumAltered{"userRole", {}, {"admin"}});
    REQUIRE(stmts.size() == 4);
    REQUIRE(stmts[0] == "ALTER TYPE \"user_role\" RENAME TO \"user_role_old\";");
    REQUIRE(stmts[1] == "CREATE TYPE \"user_role\" AS ENUM ('member');");
    REQUIRE(stmts[2] == "ALTER TABLE \"users\" ALTER COLUMN \"role\" TYPE \"user_role\" USING \"role\"::text::\"user_role\";");
    REQUIRE(stmts[3] == "DROP TYPE \"user_role_old\";");

    REQUIRE(pg(EnumAltered{"userRole", {"owner"}, {}}) ==
            std::vector<std::string>{"ALTER TYPE \"user_role\" ADD VALUE 'owner';"});
}

TEST_CASE("Enum types are created first and dropped last", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    SchemaSnapshot after = blog_schema();
    after.enums.erase("userRole");
    after.enums.set("postState", {"draft"});
    after.tables.find("users")->columns.erase("role");

    auto stmts = generate_migration_statements(compute_diff(before, after), after, pg_dialect());
    REQUIRE(stmts.front() == "CREATE TYPE \"post_state\" AS ENUM ('draft');");
    REQUIRE(stmts.back() == "DROP TYPE \"user_role\";");
}

TEST_CASE("Rollback restores the previous state for each kind of change", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    SchemaSnapshot after = blog_schema();
    after.tables.erase("posts");
    after.tables.find("users")->indexes.clear();
    after.tables.find("users")->columns.set("bio", ColumnSnapshot{"text", true});

    auto changes = compute_diff(before, after);
    const std::string up = generate_migration_sql(changes, after, pg_dialect());
    const std::string down = generate_rollback_sql(changes, before, pg_dialect());

    REQUIRE(contains(up, "DROP TABLE \"posts\";"));
    REQUIRE(contains(up, "ADD COLUMN \"bio\" text;"));
    REQUIRE(contains(up, "DROP INDEX \"idx_users_created_at\";"));

    REQUIRE(contains(down, "CREATE TABLE \"posts\""));
    REQUIRE(contains(down, "DROP COLUMN \"bio\";"));
    REQUIRE(contains(down, "CREATE INDEX \"idx_users_created_at\" ON \"users\" (\"created_at\");"));
    // reverse order: the index comes back before the table that was dropped first
    REQUIRE(down.find("CREATE INDEX") < down.find("CREATE TABLE \"posts\""));
}

TEST_CASE("Rollback of an added table drops it", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    before.tables.erase("posts");
    SchemaSnapshot after = blog_schema();

    auto changes = compute_diff(before, after);
    REQUIRE(generate_rollback_sql(changes, before, pg_dialect()) == "DROP TABLE \"posts\";");
}

TEST_CASE("Rollback of a removed column re-adds its definition", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    ColumnSnapshot nick{"text", true};
    nick.default_value = "'anon'";
    before.tables.find("users")->columns.set("nickName", nick);
    SchemaSnapshot after = blog_schema();

    auto changes = compute_diff(before, after);
    REQUIRE(generate_migration_sql(changes, after, pg_dialect()) ==
            "ALTER TABLE \"users\" DROP COLUMN \"nick_name\";");
    REQUIRE(generate_rollback_sql(changes, before, pg_dialect()) ==
            "ALTER TABLE \"users\" ADD COLUMN \"nick_name\" text DEFAULT 'anon';");
}

TEST_CASE("Rollback of an altered column restores nullability and default", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    before.tables.find("users")->columns.set("age", ColumnSnapshot{"integer", true});
    SchemaSnapshot after = blog_schema();
    ColumnSnapshot age{"integer"};
    age.default_value = "0";
    after.tables.find("users")->columns.set("age", age);

    auto changes = compute_diff(before, after);
    REQUIRE(generate_migration_statements(changes, after, pg_dialect()) == std::vector<std::string>{
        "ALTER TABLE \"users\" ALTER COLUMN \"age\" SET NOT NULL;",
        "ALTER TABLE \"users\" ALTER COLUMN \"age\" SET DEFAULT 0;",
    });
    REQUIRE(generate_migration_statements(reverse_changes(changes), before, pg_dialect()) ==
            std::vector<std::string>{
                "ALTER TABLE \"users\" ALTER COLUMN \"age\" DROP NOT NULL;",
                "ALTER TABLE \"users\" ALTER COLUMN \"age\" DROP DEFAULT;",
            });

    before.tables.find("users")->columns.set("age", ColumnSnapshot{"bigint", true});
    changes = compute_diff(before, after);
    REQUIRE(contains(generate_rollback_sql(changes, before, pg_dialect()),
                     "ALTER TABLE \"users\" ALTER COLUMN \"age\" TYPE bigint;"));
}

TEST_CASE("Rollback of an added index drops it", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    before.tables.find("users")->indexes.clear();
    SchemaSnapshot after = blog_schema();
    after.tables.find("users")->indexes.push_back(IndexSnapshot{{"email", "role"}, "users_by_email", true});

    auto changes = compute_diff(before, after);
    REQUIRE(generate_rollback_sql(changes, before, pg_dialect()) ==
            "DROP INDEX \"users_by_email\";\n\n"
            "DROP INDEX \"idx_users_created_at\";");
}

TEST_CASE("Rollback of enum additions and removals", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    before.enums.set("legacyFlag", {"x", "y"});
    SchemaSnapshot after = blog_schema();
    after.enums.set("postState", {"draft", "live"});

    auto changes = compute_diff(before, after);
    REQUIRE(generate_rollback_sql(changes, before, pg_dialect()) ==
            "CREATE TYPE \"legacy_flag\" AS ENUM ('x', 'y');\n\n"
            "DROP TYPE \"post_state\";");
    REQUIRE(generate_rollback_sql(changes, before, sqlite_dialect()).empty());
}

TEST_CASE("Rollback of enum value changes", "[ddl]") {
    SchemaSnapshot before = blog_schema();
    SchemaSnapshot after = blog_schema();
    after.enums.set("userRole", {"member", "admin", "owner"});

    // undoing an added value recreates the type with the old values
    auto added = compute_diff(before, after);
    REQUIRE(generate_migration_statements(reverse_changes(added), before, pg_dialect()) ==
            std::vector<std::string>{
                "ALTER TYPE \"user_role\" RENAME TO \"user_role_old\";",
                "CREATE TYPE \"user_role\" AS ENUM ('member', 'admin');",
                "ALTER TABLE \"users\" ALTER COLUMN \"role\" TYPE \"user_role\" USING \"role\"::text::\"user_role\";",
                "DROP TYPE \"user_role_old\";",
            });

    // undoing a removed value adds it back
    after.enums.set("userRole", {"member"});
    auto removed = compute_diff(before, after);
    REQUIRE(generate_rollback_sql(removed, before, pg_dialect()) ==
            "ALTER TYPE \"user_role\" ADD VALUE 'admin';");
}

TEST_CASE("Rename rolls back to the old name", "[ddl]") {
    SchemaSnapshot before, after;
    before.tables["users"].columns.set("name", ColumnSnapshot{"text"});
    after.tables["users"].columns.set("displayName", ColumnSnapshot{"text"});

    auto changes = compute_diff(before, after);
    REQUIRE(generate_rollback_sql(changes, before, pg_dialect()) ==
            "ALTER TABLE \"users\" RENAME COLUMN \"display_name\" TO \"name\";");
}

TEST_CASE("Empty diff produces no SQL", "[ddl]") {
    REQUIRE(generate_migration_sql({}, blog_schema(), pg_dialect()).empty());
    REQUIRE_FALSE(generate_schema_sql(blog_schema(), sqlite_dialect()).empty());
}
