#include "catch.hpp"
#include "tabula/differ.hpp"

using namespace tabula;

static ColumnSnapshot col(const std::string& type, bool nullable = false, bool primary = false, bool unique = false) {
    ColumnSnapshot c;
    c.type = type;
    c.nullable = nullable;
    c.primary = primary;
    c.unique = unique;
    return c;
}

static std::vector<std::string> types(const DiffResult& changes) {
    std::vector<std::string> out;
    for (const auto& c : changes) out.push_back(change_type(c));
    return out;
}

TEST_CASE("Identical snapshots have no changes", "[differ]") {
    SchemaSnapshot s;
    s.tables["users"].columns.set("id", col("uuid", false, true));
    REQUIRE(compute_diff(s, s).empty());
}

TEST_CASE("Tables added and removed", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["legacy"].columns.set("id", col("integer"));
    after.tables["users"].columns.set("id", col("uuid"));

    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"table_added", "table_removed"});
    REQUIRE(std::get<TableAdded>(changes[0]).table == "users");
    REQUIRE(is_destructive(changes[1]));
}

TEST_CASE("Column rename is detected by similarity", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["users"].columns.set("id", col("uuid", false, true));
    before.tables["users"].columns.set("name", col("text"));
    after.tables["users"].columns.set("id", col("uuid", false, true));
    after.tables["users"].columns.set("fullName", col("text"));

    auto changes = compute_diff(before, after);
    REQUIRE(changes.size() == 1);
    const auto& r = std::get<ColumnRenamed>(changes[0]);
    REQUIRE(r.old_column == "name");
    REQUIRE(r.new_column == "fullName");
    REQUIRE(r.confidence == Approx(1.0));
}

TEST_CASE("Dissimilar columns are an add and a remove", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["users"].columns.set("age", col("integer"));
    after.tables["users"].columns.set("bio", col("text", true));

    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"column_added", "column_removed"});
    REQUIRE(column_similarity(col("integer"), col("text", true)) < RENAME_THRESHOLD);
}

TEST_CASE("Rename ties go to the first added column", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["t"].columns.set("a", col("text"));
    after.tables["t"].columns.set("b", col("text"));
    after.tables["t"].columns.set("c", col("text"));

    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"column_renamed", "column_added"});
    REQUIRE(std::get<ColumnRenamed>(changes[0]).new_column == "b");
    REQUIRE(std::get<ColumnAdded>(changes[1]).column == "c");
}

TEST_CASE("A column is claimed by one rename only", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["t"].columns.set("x", col("text"));
    before.tables["t"].columns.set("y", col("text"));
    after.tables["t"].columns.set("z", col("text"));

    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"column_renamed", "column_removed"});
    REQUIRE(std::get<ColumnRenamed>(changes[0]).old_column == "x");
    REQUIRE(std::get<ColumnRemoved>(changes[1]).column == "y");
}

TEST_CASE("Alterations carry only the changed fields", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["t"].columns.set("n", col("integer"));
    ColumnSnapshot changed = col("bigint", true);
    changed.default_value = "0";
    after.tables["t"].columns.set("n", changed);

    auto changes = compute_diff(before, after);
    REQUIRE(changes.size() == 1);
    const auto& alt = std::get<ColumnAltered>(changes[0]);
    REQUIRE(alt.old_type == std::optional<std::string>("integer"));
    REQUIRE(alt.new_type == std::optional<std::string>("bigint"));
    REQUIRE(alt.new_nullable == std::optional<bool>(true));
    REQUIRE(alt.default_changed);
    REQUIRE_FALSE(alt.old_default.has_value());
    REQUIRE(alt.new_default == std::optional<std::string>("0"));
}

TEST_CASE("Index changes are keyed by column list", "[differ]") {
    SchemaSnapshot before, after;
    before.tables["t"].columns.set("a", col("text"));
    before.tables["t"].indexes.push_back(IndexSnapshot{{"a"}, std::nullopt, false});
    after.tables["t"].columns.set("a", col("text"));
    after.tables["t"].indexes.push_back(IndexSnapshot{{"a"}, std::string("renamed_idx"), false});
    REQUIRE(compute_diff(before, after).empty());

    after.tables["t"].indexes.push_back(IndexSnapshot{{"a", "b"}, std::nullopt, true});
    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"index_added"});
    REQUIRE(std::get<IndexAdded>(changes[0]).unique);
}

TEST_CASE("Enum changes", "[differ]") {
    SchemaSnapshot before, after;
    before.enums.set("role", {"user", "admin"});
    before.enums.set("old", {"x"});
    after.enums.set("role", {"user", "owner"});
    after.enums.set("status", {"on", "off"});

    auto changes = compute_diff(before, after);
    REQUIRE(types(changes) == std::vector<std::string>{"enum_added", "enum_removed", "enum_altered"});
    const auto& alt = std::get<EnumAltered>(changes[2]);
    REQUIRE(alt.added_values == std::vector<std::string>{"owner"});
    REQUIRE(alt.removed_values == std::vector<std::string>{"admin"});
}

TEST_CASE("Reversed changes undo in reverse order", "[differ]") {
    DiffResult changes = {
        TableAdded{"users"},
        ColumnRenamed{"posts", "title", "headline", 1.0},
        EnumAltered{"role", {"owner"}, {"admin"}},
    };
    auto reversed = reverse_changes(changes);
    REQUIRE(types(reversed) == std::vector<std::string>{"enum_altered", "column_renamed", "table_removed"});
    REQUIRE(std::get<EnumAltered>(reversed[0]).added_values == std::vector<std::string>{"admin"});
    REQUIRE(std::get<ColumnRenamed>(reversed[1]).old_column == "headline");
    REQUIRE(std::get<ColumnRenamed>(reversed[1]).new_column == "title");
    REQUIRE(std::get<TableRemoved>(reversed[2]).table == "users");
}
