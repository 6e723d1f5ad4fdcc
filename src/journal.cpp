#include "tabula/journal.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include "tabula/lib.hpp"
#include "tabula/runner.hpp"

namespace tabula {

bool Journal::from_json(const jval& doc, Journal& journal) {
    if (!doc.IsObject()) return false;
    journal.version = jhlp::get<int>(doc, "version", 1);
    journal.migrations.clear();
    if (!doc.HasMember("migrations")) return true;

    const jval& list = doc["migrations"];
    if (!list.IsArray()) return false;
    for (const auto& m : list.GetArray()) {
        if (!m.IsObject()) return false;
        JournalEntry e;
        e.name = jhlp::get<std::string>(m, "name");
        e.description = jhlp::get<std::string>(m, "description");
        e.created_at = jhlp::get<std::string>(m, "createdAt");
        e.checksum = jhlp::get<std::string>(m, "checksum");
        if (e.name.empty()) return false;
        journal.migrations.push_back(std::move(e));
    }
    return true;
}

jdoc Journal::to_json() const {
    jdoc doc;
    doc.SetObject();
    auto& a = doc.GetAllocator();
    jhlp::set(doc, "version", version);

    jval list(json::kArrayType);
    for (const auto& e : migrations) {
        jval m(json::kObjectType);
        jhlp::set(m, "name", e.name, a);
        jhlp::set(m, "description", e.description, a);
        jhlp::set(m, "createdAt", e.created_at, a);
        jhlp::set(m, "checksum", e.checksum, a);
        list.PushBack(m, a);
    }
    jhlp::put(doc, "migrations", list, a);
    return doc;
}

Journal create_journal() {
    return Journal{};
}

Journal add_journal_entry(const Journal& journal, JournalEntry entry) {
    Journal next = journal;
    next.migrations.push_back(std::move(entry));
    return next;
}

Journal read_journal(const std::string& path) {
    Journal journal;
    if (!std::filesystem::exists(path)) return journal;

    jdoc doc;
    if (!jhlp::parse_file(path, doc)) TABULA_THROW("journal %s is not valid JSON", path.c_str());
    if (!Journal::from_json(doc, journal)) TABULA_THROW("journal %s has an unexpected shape", path.c_str());
    return journal;
}

void write_journal(const std::string& path, const Journal& journal) {
    jdoc doc = journal.to_json();
    jhlp::write_file(path, doc);
}

std::vector<Collision> detect_collisions(const Journal& journal, const std::vector<std::string>& existing_files) {
    std::map<int64_t, std::string> recorded;  // sequence -> journal name
    int64_t highest = 0;
    for (const auto& e : journal.migrations) {
        auto parsed = parse_migration_name(e.name);
        if (!parsed) continue;
        recorded.emplace(parsed->sequence, e.name);
        highest = std::max(highest, parsed->sequence);
    }
    for (const auto& f : existing_files) {
        if (auto parsed = parse_migration_name(f)) highest = std::max(highest, parsed->sequence);
    }

    std::vector<Collision> out;
    int64_t next = highest + 1;
    for (const auto& f : existing_files) {
        auto parsed = parse_migration_name(f);
        if (!parsed) continue;
        auto it = recorded.find(parsed->sequence);
        if (it == recorded.end() || it->second == f) continue;

        const auto dot = f.rfind('.');
        const std::string ext = dot == std::string::npos ? "sql" : f.substr(dot + 1);
        out.push_back(Collision{it->second, f, parsed->sequence,
                                format_migration_name(next++, parsed->description, ext)});
    }
    return out;
}

} // namespace tabula
