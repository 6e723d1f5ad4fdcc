#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include <filesystem>
#include "tabula/snapshot.hpp"
#include "tabula/table.hpp"

using namespace tabula;

static const char* USERS_SNAPSHOT = R"({
  "version": 1,
  "tables": {
    "users": {
      "columns": {
        "id":        { "type": "uuid", "primary": true },
        "email":     { "type": "text", "unique": true },
        "status":    { "type": "status", "default": "'active'" },
        "createdAt": { "type": "timestamp", "default": "now()" },
        "password":  { "type": "text", "sensitive": true, "hidden": true }
      },
      "indexes": [ { "columns": ["email", "status"], "name": "idx_users_email_status" } ],
      "foreignKeys": []
    },
    "posts": {
      "columns": {
        "id":       { "type": "uuid", "primary": true },
        "authorId": { "type": "uuid", "nullable": true }
      },
      "foreignKeys": [ { "column": "authorId", "targetTable": "users", "targetColumn": "id" } ]
    }
  },
  "enums": { "status": ["active", "banned"] }
})";

TEST_CASE("Snapshot loads from JSON in declaration order", "[snapshot]") {
    SchemaSnapshot snap = SchemaSnapshot::parse(USERS_SNAPSHOT);
    REQUIRE(snap.tables.keys() == std::vector<std::string>{"users", "posts"});

    const TableSnapshot* users = snap.tables.find("users");
    REQUIRE(users);
    REQUIRE(users->columns.keys() == std::vector<std::string>{"id", "email", "status", "createdAt", "password"});
    REQUIRE(users->columns.find("id")->primary);
    REQUIRE_FALSE(users->columns.find("id")->nullable);
    REQUIRE(users->columns.find("email")->unique);
    REQUIRE(users->columns.find("status")->default_value == std::optional<std::string>("'active'"));
    REQUIRE(users->columns.find("password")->sensitive);
    REQUIRE(users->indexes.size() == 1);
    REQUIRE(users->indexes[0].name == std::optional<std::string>("idx_users_email_status"));

    const TableSnapshot* posts = snap.tables.find("posts");
    REQUIRE(posts->foreign_keys.size() == 1);
    REQUIRE(posts->foreign_keys[0].target_table == "users");
    REQUIRE(*snap.enums.find("status") == std::vector<std::string>{"active", "banned"});
}

TEST_CASE("Snapshot JSON survives a save and load", "[snapshot]") {
    SchemaSnapshot snap = SchemaSnapshot::parse(USERS_SNAPSHOT);
    const std::string path = (std::filesystem::temp_directory_path() / "tabula_test_snapshots" / "schema.json").string();
    std::filesystem::remove(path);

    FileSnapshotStorage storage;
    REQUIRE_FALSE(storage.load(path).has_value());
    storage.save(path, snap);

    auto loaded = storage.load(path);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == snap);
    std::filesystem::remove(path);
}

TEST_CASE("Invalid snapshot documents are rejected", "[snapshot]") {
    SchemaSnapshot snap;
    jdoc doc;
    doc.Parse(R"({"tables": {"users": {"columns": {"id": {"nullable": true}}}}})");
    REQUIRE_FALSE(SchemaSnapshot::from_json(doc, snap));
    REQUIRE_THROWS(SchemaSnapshot::parse("{not json"));
}

TEST_CASE("Declared tables produce a snapshot", "[snapshot]") {
    jdoc doc;
    doc.Parse(R"({
      "name": "articles",
      "properties": {
        "id":        { "type": "uuid", "primary": true, "default": {"sql": "gen_random_uuid()"} },
        "title":     { "type": "text" },
        "state":     { "enum": ["draft", "published"], "enumName": "articleState", "default": "draft" },
        "published": { "type": "boolean", "default": false },
        "views":     { "type": "integer", "default": 0 },
        "createdAt": { "type": "timestamp", "default": "now", "readOnly": true },
        "updatedAt": { "type": "timestamp", "nullable": true, "autoUpdate": true }
      },
      "indexes": [ { "fields": ["title"], "unique": true } ]
    })");
    TableDef table;
    REQUIRE(TableDef::from_json(doc, table));
    REQUIRE(table.primary_key() == "id");
    REQUIRE(table.timestamp_columns() == std::vector<std::string>{"createdAt"});
    REQUIRE(table.read_only_columns() == std::vector<std::string>{"createdAt"});
    REQUIRE(table.auto_update_columns() == std::vector<std::string>{"updatedAt"});

    SchemaSnapshot snap = create_snapshot({table});
    const TableSnapshot& t = *snap.tables.find("articles");
    REQUIRE(t.columns.find("id")->default_value == std::optional<std::string>("gen_random_uuid()"));
    REQUIRE(t.columns.find("state")->type == "articleState");
    REQUIRE(t.columns.find("state")->default_value == std::optional<std::string>("'draft'"));
    REQUIRE(t.columns.find("published")->default_value == std::optional<std::string>("FALSE"));
    REQUIRE(t.columns.find("views")->default_value == std::optional<std::string>("0"));
    REQUIRE(t.columns.find("createdAt")->default_value == std::optional<std::string>("now()"));
    REQUIRE(t.indexes.size() == 1);
    REQUIRE(t.indexes[0].unique);
    REQUIRE(*snap.enums.find("articleState") == std::vector<std::string>{"draft", "published"});
}

TEST_CASE("Hidden and sensitive columns narrow the default selection", "[snapshot]") {
    TableDef t;
    t.name = "users";
    ColumnDef id; id.name = "id"; id.type = "uuid"; id.primary = true;
    ColumnDef email; email.name = "email"; email.type = "text"; email.sensitive = true;
    ColumnDef hash; hash.name = "passwordHash"; hash.type = "text"; hash.hidden = true;
    t.columns = {id, email, hash};

    REQUIRE(resolve_select_columns(t) == std::vector<std::string>{"id", "email"});
    REQUIRE(resolve_select_columns(t, Selection{{}, true}) == std::vector<std::string>{"id"});
    REQUIRE(resolve_select_columns(t, Selection{{"passwordHash"}, false}) == std::vector<std::string>{"passwordHash"});
}
