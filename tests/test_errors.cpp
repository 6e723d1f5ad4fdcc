#include "catch.hpp"
#include "tabula/errors.hpp"
#include "tabula/executor.hpp"

using namespace tabula;

// Executes through a query function that throws @p e; the classified error escapes.
template <class E>
static void execute_failing(const E& e, Dialect dialect = Dialect::Postgres) {
    Executor ex([e](const std::string&, const Params&) -> QueryResult { throw e; }, dialect_for(dialect));
    ex.execute("INSERT INTO \"users\" (\"email\") VALUES ($1)", {"a@b.c"});
}

TEST_CASE("Postgres unique violation carries column and value", "[errors]") {
    BackendError e(Dialect::Postgres, "23505", "duplicate key value violates unique constraint \"users_email_key\"");
    e.table = "users";
    e.constraint = "users_email_key";
    e.detail = "Key (email)=(a@b.c) already exists.";
    try {
        execute_failing(e);
        FAIL("expected a ConstraintError");
    } catch (const ConstraintError& err) {
        REQUIRE(err.kind() == ConstraintKind::Unique);
        REQUIRE(err.name() == "UniqueConstraintError");
        REQUIRE(err.code() == "UNIQUE_VIOLATION");
        REQUIRE(err.table() == std::optional<std::string>("users"));
        REQUIRE(err.column() == "email");
        REQUIRE(err.value() == std::optional<std::string>("a@b.c"));
        REQUIRE(err.pg_code() == std::optional<std::string>("23505"));
        REQUIRE(err.query().has_value());
    }
}

TEST_CASE("Postgres SQLSTATE classes map onto the taxonomy", "[errors]") {
    SECTION("foreign key") {
        BackendError e(Dialect::Postgres, "23503", "insert violates foreign key");
        e.table = "posts";
        e.constraint = "posts_author_id_fkey";
        try { execute_failing(e); FAIL("expected a ConstraintError"); }
        catch (const ConstraintError& err) {
            REQUIRE(err.kind() == ConstraintKind::ForeignKey);
            REQUIRE(err.constraint() == "posts_author_id_fkey");
        }
    }
    SECTION("not null parsed from the message") {
        BackendError e(Dialect::Postgres, "23502",
                       "null value in column \"name\" of relation \"users\" violates not-null constraint");
        try { execute_failing(e); FAIL("expected a ConstraintError"); }
        catch (const ConstraintError& err) {
            REQUIRE(err.kind() == ConstraintKind::NotNull);
            REQUIRE(err.column() == "name");
            REQUIRE(err.table() == std::optional<std::string>("users"));
        }
    }
    SECTION("check") {
        BackendError e(Dialect::Postgres, "23514",
                       "new row for relation \"users\" violates check constraint \"age_positive\"");
        try { execute_failing(e); FAIL("expected a ConstraintError"); }
        catch (const ConstraintError& err) {
            REQUIRE(err.kind() == ConstraintKind::Check);
            REQUIRE(err.constraint() == "age_positive");
        }
    }
    SECTION("connection class") {
        REQUIRE_THROWS_AS(execute_failing(BackendError(Dialect::Postgres, "08006", "connection failure")),
                          ConnectionError);
        REQUIRE_THROWS_AS(execute_failing(BackendError(Dialect::Postgres, "57P01", "terminating")),
                          ConnectionError);
    }
    SECTION("anything else") {
        REQUIRE_THROWS_AS(execute_failing(BackendError(Dialect::Postgres, "42601", "syntax error")), QueryError);
    }
}

TEST_CASE("SQLite result codes map onto the taxonomy", "[errors]") {
    try {
        execute_failing(BackendError(Dialect::SQLite, "SQLITE_CONSTRAINT_UNIQUE",
                                     "UNIQUE constraint failed: users.email"), Dialect::SQLite);
        FAIL("expected a ConstraintError");
    } catch (const ConstraintError& err) {
        REQUIRE(err.kind() == ConstraintKind::Unique);
        REQUIRE(err.table() == std::optional<std::string>("users"));
        REQUIRE(err.column() == "email");
    }
    try {
        execute_failing(BackendError(Dialect::SQLite, "SQLITE_CONSTRAINT_NOTNULL",
                                     "NOT NULL constraint failed: users.name"), Dialect::SQLite);
        FAIL("expected a ConstraintError");
    } catch (const ConstraintError& err) {
        REQUIRE(err.kind() == ConstraintKind::NotNull);
        REQUIRE(err.column() == "name");
    }
    REQUIRE_THROWS_AS(execute_failing(BackendError(Dialect::SQLite, "SQLITE_CANTOPEN", "unable to open"),
                                      Dialect::SQLite), ConnectionError);
    REQUIRE_THROWS_AS(execute_failing(BackendError(Dialect::SQLite, "SQLITE_ERROR", "no such table: x"),
                                      Dialect::SQLite), QueryError);
}

TEST_CASE("Unstructured failures are classified by message", "[errors]") {
    REQUIRE_THROWS_AS(execute_failing(std::runtime_error("Connection refused")), ConnectionError);
    REQUIRE_THROWS_AS(execute_failing(std::runtime_error("statement timed out")), ConnectionError);
    REQUIRE_THROWS_AS(execute_failing(std::runtime_error("boom")), QueryError);
}

TEST_CASE("DbError passes through the Executor unchanged", "[errors]") {
    REQUIRE_THROWS_AS(execute_failing(NotFoundError("users")), NotFoundError);
}

TEST_CASE("Error JSON form", "[errors]") {
    ConstraintInfo info;
    info.kind = ConstraintKind::Unique;
    info.table = "users";
    info.column = "email";
    ConstraintError err(info);
    jdoc doc = err.to_json();
    REQUIRE(std::string(doc["error"].GetString()) == "UniqueConstraintError");
    REQUIRE(std::string(doc["code"].GetString()) == "UNIQUE_VIOLATION");
    REQUIRE(std::string(doc["table"].GetString()) == "users");
    REQUIRE(std::string(doc["column"].GetString()) == "email");

    NotFoundError nf("posts");
    REQUIRE(nf.code() == "NOT_FOUND");
    REQUIRE(std::string(nf.to_json()["message"].GetString()) == "Record not found in table posts");
}

TEST_CASE("Key detail parsing", "[errors]") {
    auto kv = parse_pg_key_detail("Key (email)=(a@b.c) already exists.");
    REQUIRE(kv);
    REQUIRE(kv->first == "email");
    REQUIRE(kv->second == "a@b.c");
    REQUIRE_FALSE(parse_pg_key_detail("nothing here"));
}
