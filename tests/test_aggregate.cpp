#include "catch.hpp"
#include "tabula/aggregate.hpp"
#include "tabula/errors.hpp"
#include "fake_sql.hpp"

using namespace tabula;

TEST_CASE("COUNT statement", "[aggregate]") {
    SqlQuery all = build_count("blogPosts", {});
    REQUIRE(all.sql == "SELECT COUNT(*) AS \"count\" FROM \"blog_posts\"");
    REQUIRE(all.params.empty());

    SqlQuery some = build_count("posts", parse_where(R"({"authorId": 4})"), sqlite_dialect());
    REQUIRE(some.sql == "SELECT COUNT(*) AS \"count\" FROM \"posts\" WHERE \"author_id\" = ?1");
    REQUIRE(some.params == Params{4});
}

TEST_CASE("Aggregate projections", "[aggregate]") {
    AggregateSpec spec;
    spec.count = {"authorId"};
    spec.avg = {"viewCount"};
    spec.max = {"score"};

    SqlQuery q = build_aggregate("posts", {}, spec);
    REQUIRE(q.sql ==
            "SELECT COUNT(\"author_id\") AS \"_count_author_id\", AVG(\"view_count\") AS \"_avg_view_count\", "
            "MAX(\"score\") AS \"_max_score\" FROM \"posts\"");
    REQUIRE(aggregate_aliases(spec) ==
            std::vector<std::string>{"_count_author_id", "_avg_view_count", "_max_score"});

    spec.count_all = true;
    REQUIRE(starts_with(build_aggregate("posts", {}, spec).sql, "SELECT COUNT(*) AS \"_count\", AVG("));

    REQUIRE_THROWS_AS(build_aggregate("posts", {}, AggregateSpec{}), QueryError);
}

TEST_CASE("GROUP BY with validated ordering", "[aggregate]") {
    GroupByOptions o;
    o.table = "posts";
    o.by = {"status"};
    o.where = parse_where(R"({"published": true})");
    o.aggregate.count_all = true;
    o.aggregate.avg = {"views"};
    o.order_by = {{"_count", "DESC"}, {"_avg_views", "asc"}, {"status", "asc"}};
    o.limit = 10;
    o.offset = 5;

    SqlQuery q = build_group_by(o);
    REQUIRE(q.sql ==
            "SELECT \"status\", COUNT(*) AS \"_count\", AVG(\"views\") AS \"_avg_views\" FROM \"posts\" "
            "WHERE \"published\" = $1 GROUP BY \"status\" "
            "ORDER BY COUNT(*) DESC, \"_avg_views\" ASC, \"status\" ASC LIMIT $2 OFFSET $3");
    REQUIRE(q.params == Params{true, 10, 5});
}

TEST_CASE("GROUP BY rejects unsafe ordering", "[aggregate]") {
    GroupByOptions o;
    o.table = "posts";
    o.by = {"status"};
    o.aggregate.count_all = true;

    SECTION("direction") {
        o.order_by = {{"status", "asc, (SELECT 1)"}};
        REQUIRE_THROWS_AS(build_group_by(o), QueryError);
    }
    SECTION("alias that was not requested") {
        o.order_by = {{"_sum_views", "asc"}};
        REQUIRE_THROWS_AS(build_group_by(o), QueryError);
    }
    SECTION("column outside the group") {
        o.order_by = {{"title", "asc"}};
        REQUIRE_THROWS_AS(build_group_by(o), QueryError);
    }
    SECTION("no group columns") {
        o.by.clear();
        REQUIRE_THROWS_AS(build_group_by(o), QueryError);
    }
}

TEST_CASE("Flat aggregate rows are reshaped", "[aggregate]") {
    jdoc doc;
    doc.Parse(R"({"status": "draft", "_count": "3", "_avg_views": 12.5, "_max_score": null})");

    AggregateSpec spec;
    spec.count_all = true;
    spec.avg = {"views"};
    spec.max = {"score"};

    jdoc out;
    jval shaped = restructure_aggregate(doc, spec, {"status"}, out.GetAllocator());
    REQUIRE(jhlp::stringify(shaped) ==
            R"({"status":"draft","_count":3,"_avg":{"views":12.5},"_max":{"score":null}})");
}

TEST_CASE("Per-column counts become an object", "[aggregate]") {
    jdoc doc;
    doc.Parse(R"({"_count_author_id": 7})");

    AggregateSpec spec;
    spec.count = {"authorId"};

    jdoc out;
    jval shaped = restructure_aggregate(doc, spec, {}, out.GetAllocator());
    REQUIRE(jhlp::stringify(shaped) == R"({"_count":{"authorId":7}})");
}
