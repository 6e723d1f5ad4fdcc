#include "catch.hpp"
#include <filesystem>
#include <fstream>
#include "tabula/journal.hpp"
#include "tabula/runner.hpp"

using namespace tabula;

static JournalEntry entry(const std::string& name) {
    return JournalEntry{name, "", "2024-05-01T12:00:00Z", compute_checksum(name)};
}

TEST_CASE("Adding an entry leaves the original journal untouched", "[journal]") {
    Journal empty = create_journal();
    Journal one = add_journal_entry(empty, entry("0001_init.sql"));
    REQUIRE(empty.migrations.empty());
    REQUIRE(one.migrations.size() == 1);
    REQUIRE(one.version == 1);
}

TEST_CASE("Journal files", "[journal]") {
    const auto dir = std::filesystem::temp_directory_path() / "tabula_test_journal";
    const std::string path = (dir / "journal.json").string();
    std::filesystem::remove_all(dir);

    REQUIRE(read_journal(path).migrations.empty());

    Journal j = add_journal_entry(add_journal_entry(create_journal(), entry("0001_init.sql")),
                                  entry("0002_add_age.sql"));
    j.migrations[1].description = "add age";
    write_journal(path, j);

    Journal back = read_journal(path);
    REQUIRE(back.migrations.size() == 2);
    REQUIRE(back.migrations[1].name == "0002_add_age.sql");
    REQUIRE(back.migrations[1].description == "add age");
    REQUIRE(back.migrations[0].checksum == compute_checksum("0001_init.sql"));

    {
        std::ofstream broken(path, std::ios::trunc);
        broken << "{\"migrations\": 3}";
    }
    REQUIRE_THROWS(read_journal(path));
    std::filesystem::remove_all(dir);
}

TEST_CASE("Sequence collisions suggest the next free number", "[journal]") {
    Journal j = create_journal();
    j = add_journal_entry(j, entry("0001_init.sql"));
    j = add_journal_entry(j, entry("0002_add_age.sql"));

    auto collisions = detect_collisions(j, {
        "0001_init.sql", "0002_add_age.sql", "0002_add_email.sql", "0003_posts.sql", "0001_other.up.sql",
    });
    REQUIRE(collisions.size() == 2);

    REQUIRE(collisions[0].existing_name == "0002_add_age.sql");
    REQUIRE(collisions[0].conflicting_name == "0002_add_email.sql");
    REQUIRE(collisions[0].sequence_number == 2);
    REQUIRE(collisions[0].suggested_name == "0004_add_email.sql");

    REQUIRE(collisions[1].conflicting_name == "0001_other.up.sql");
    REQUIRE(collisions[1].suggested_name == "0005_other.up.sql");

    REQUIRE(detect_collisions(j, {"0001_init.sql", "0002_add_age.sql"}).empty());
}
