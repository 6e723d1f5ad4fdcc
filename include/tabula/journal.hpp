#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "tabula/jsonhlp.hpp"

namespace tabula {

struct JournalEntry {
    std::string name;
    std::string description;
    std::string created_at;   // ISO-8601
    std::string checksum;
};

/**
 * Developer-side record of locally created migrations.
 * JSON form: {version:1, migrations:[{name, description, createdAt, checksum}]}
 * Only used to spot sequence numbers reused by another branch; never drives apply.
 */
struct Journal {
    int version = 1;
    std::vector<JournalEntry> migrations;

    static bool from_json(const jval& doc, Journal& journal);
    jdoc to_json() const;
};

struct Collision {
    std::string existing_name;     // journal entry holding the sequence
    std::string conflicting_name;  // on-disk file reusing it
    int64_t sequence_number = 0;
    std::string suggested_name;    // conflicting file renumbered to the next free sequence
};

Journal create_journal();

// Returns a new journal; @p journal is left untouched.
Journal add_journal_entry(const Journal& journal, JournalEntry entry);

// Missing file -> empty journal. Invalid content throws.
Journal read_journal(const std::string& path);
void write_journal(const std::string& path, const Journal& journal);

// Suggests only; files are never renamed here.
std::vector<Collision> detect_collisions(const Journal& journal, const std::vector<std::string>& existing_files);

} // namespace tabula
