#include "catch.hpp"
#include <map>
#include <stdexcept>
#include "tabula/auto_migrate.hpp"
#include "tabula/runner.hpp"
#include "tabula/sqlconnection.hpp"
#include "fake_sql.hpp"

using namespace tabula;

// Keeps snapshots in memory between runs.
class MemorySnapshotStorage : public SnapshotStorage {
public:
    std::optional<SchemaSnapshot> load(const std::string& key) override {
        auto it = saved_.find(key);
        if (it == saved_.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& key, const SchemaSnapshot& snapshot) override {
        saved_[key] = snapshot;
    }

private:
    std::map<std::string, SchemaSnapshot> saved_;
};

static SchemaSnapshot shop_schema() {
    return SchemaSnapshot::parse(R"({
      "tables": {
        "customers": {
          "columns": {
            "id":        { "type": "integer", "primary": true },
            "email":     { "type": "text", "unique": true },
            "tier":      { "type": "tier", "default": "'basic'" },
            "createdAt": { "type": "timestamp", "default": "now()" }
          }
        },
        "orders": {
          "columns": {
            "id":         { "type": "integer", "primary": true },
            "customerId": { "type": "integer" },
            "total":      { "type": "float", "nullable": true }
          },
          "indexes": [ { "columns": ["customerId"] } ],
          "foreignKeys": [ { "column": "customerId", "targetTable": "customers", "targetColumn": "id" } ]
        }
      },
      "enums": { "tier": ["basic", "gold"] }
    })");
}

TEST_CASE("Auto-migrate applies, then settles", "[auto_migrate]") {
    PSQLConnection conn = make_sqlite_connection();
    conn->connect(":memory:");

    int statements = 0;
    QueryFn inner = conn->query_fn();
    Executor ex([&](const std::string& sql, const Params& params) {
        ++statements;
        return inner(sql, params);
    }, conn->dialect());

    MemorySnapshotStorage storage;
    AutoMigrateOptions options;
    options.current = shop_schema();
    options.snapshot_path = "shop";
    options.storage = &storage;
    options.transaction = [&](const std::function<void()>& body) { conn->transaction(body); };

    AutoMigrateResult first = auto_migrate(ex, options);
    REQUIRE(first.applied);
    REQUIRE(first.warnings.empty());
    REQUIRE(contains(first.sql, "CREATE TABLE \"customers\""));
    REQUIRE(contains(first.sql, "CHECK(\"tier\" IN ('basic', 'gold'))"));

    auto applied = MigrationRunner(ex).get_applied();
    REQUIRE(applied.size() == 1);
    REQUIRE(applied[0].name == "auto-migrate-initial");
    REQUIRE(applied[0].checksum == compute_checksum(first.sql));

    // the tables exist and accept rows
    ex.execute("INSERT INTO \"customers\" (\"email\") VALUES (?1)", {"a@b.c"});
    QueryResult rows = ex.execute("SELECT \"tier\", \"created_at\" FROM \"customers\"");
    REQUIRE(rows.rows.Size() == 1);
    REQUIRE(std::string(rows.rows[0]["tier"].GetString()) == "basic");
    REQUIRE(rows.rows[0]["created_at"].IsString());

    statements = 0;
    AutoMigrateResult second = auto_migrate(ex, options);
    REQUIRE_FALSE(second.applied);
    REQUIRE(second.changes.empty());
    REQUIRE(second.sql.empty());
    REQUIRE(statements == 0);
}

TEST_CASE("Destructive changes are reported and still applied", "[auto_migrate]") {
    PSQLConnection conn = make_sqlite_connection();
    conn->connect(":memory:");
    Executor ex = conn->executor();

    MemorySnapshotStorage storage;
    AutoMigrateOptions options;
    options.current = shop_schema();
    options.snapshot_path = "shop";
    options.storage = &storage;
    auto_migrate(ex, options);

    options.current.tables.erase("orders");
    AutoMigrateResult res = auto_migrate(ex, options);
    REQUIRE(res.applied);
    REQUIRE(res.warnings == std::vector<std::string>{"table_removed (table: orders)"});

    auto applied = MigrationRunner(ex).get_applied();
    REQUIRE(applied.size() == 2);
    REQUIRE(starts_with(applied[1].name, "auto-migrate-"));
    REQUIRE(applied[1].name != "auto-migrate-initial");

    QueryResult left = ex.execute("SELECT name FROM sqlite_master WHERE type='table' AND name = 'orders'");
    REQUIRE(left.rows.Empty());
    REQUIRE(storage.load("shop")->tables.keys() == std::vector<std::string>{"customers"});
}

TEST_CASE("A failed migration leaves the snapshot unsaved", "[auto_migrate]") {
    FakeDb db;
    db.responder = [](const std::string& sql, const Params&) -> std::string {
        if (contains(sql, "CREATE TABLE \"customers\"")) throw std::runtime_error("disk I/O error");
        return "[]";
    };
    Executor ex = db.executor();

    MemorySnapshotStorage storage;
    AutoMigrateOptions options;
    options.current = shop_schema();
    options.snapshot_path = "shop";
    options.storage = &storage;

    REQUIRE_THROWS_AS(auto_migrate(ex, options), MigrationError);
    REQUIRE_FALSE(storage.load("shop").has_value());
}
