#include "catch.hpp"
#include "tabula/dialect.hpp"
#include "tabula/errors.hpp"

using namespace tabula;

TEST_CASE("Placeholders are numbered per dialect", "[dialect]") {
    REQUIRE(pg_dialect().param(1) == "$1");
    REQUIRE(pg_dialect().param(12) == "$12");
    REQUIRE(sqlite_dialect().param(3) == "?3");
}

TEST_CASE("SQLite maps canonical types onto storage classes", "[dialect]") {
    const SqlDialect& d = sqlite_dialect();
    REQUIRE(d.map_type("uuid") == "TEXT");
    REQUIRE(d.map_type("varchar(255)") == "TEXT");
    REQUIRE(d.map_type("timestamp with time zone") == "TEXT");
    REQUIRE(d.map_type("boolean") == "INTEGER");
    REQUIRE(d.map_type("bigint") == "INTEGER");
    REQUIRE(d.map_type("numeric(10,2)") == "REAL");
    REQUIRE(d.map_type("bytea") == "BLOB");
    REQUIRE(pg_dialect().map_type("jsonb") == "jsonb");
}

TEST_CASE("Capability gates raise QueryError", "[dialect]") {
    REQUIRE_THROWS_AS(sqlite_dialect().require_array_ops(), QueryError);
    REQUIRE_THROWS_AS(sqlite_dialect().require_json_path(), QueryError);
    REQUIRE_NOTHROW(pg_dialect().require_array_ops());
    REQUIRE_NOTHROW(pg_dialect().require_json_path());
    REQUIRE_NOTHROW(sqlite_dialect().require_returning());
}

TEST_CASE("Dialect names parse", "[dialect]") {
    REQUIRE(parse_dialect("postgres") == Dialect::Postgres);
    REQUIRE(parse_dialect("PostgreSQL") == Dialect::Postgres);
    REQUIRE(parse_dialect("sqlite") == Dialect::SQLite);
    REQUIRE_THROWS(parse_dialect("mysql"));
    REQUIRE(dialect_for(Dialect::SQLite).name() == "sqlite");
}
