#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "tabula/jsonhlp.hpp"

namespace tabula {

/**
 * Insertion-ordered string-keyed map. Iteration order is the declaration order,
 * which the differ and the DDL generator rely on for deterministic output.
 */
template <class V>
class OrderedMap {
public:
    using value_type = std::pair<std::string, V>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    iterator begin() { return items_.begin(); }
    iterator end() { return items_.end(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const V* find(const std::string& key) const {
        for (const auto& kv : items_) if (kv.first == key) return &kv.second;
        return nullptr;
    }
    V* find(const std::string& key) {
        for (auto& kv : items_) if (kv.first == key) return &kv.second;
        return nullptr;
    }
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Inserts a default value at the end when missing.
    V& operator[](const std::string& key) {
        if (V* v = find(key)) return *v;
        items_.emplace_back(key, V{});
        return items_.back().second;
    }

    void set(const std::string& key, V value) { (*this)[key] = std::move(value); }

    bool erase(const std::string& key) {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->first == key) { items_.erase(it); return true; }
        }
        return false;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(items_.size());
        for (const auto& kv : items_) out.push_back(kv.first);
        return out;
    }

    bool operator==(const OrderedMap& other) const { return items_ == other.items_; }

private:
    std::vector<value_type> items_;
};

struct ColumnSnapshot {
    std::string type;
    bool nullable = false;
    bool primary = false;
    bool unique = false;
    std::optional<std::string> default_value; // SQL expression, e.g. 'draft' or now()
    bool sensitive = false;
    bool hidden = false;

    bool operator==(const ColumnSnapshot&) const = default;
};

struct IndexSnapshot {
    std::vector<std::string> columns;
    std::optional<std::string> name;
    bool unique = false;

    bool operator==(const IndexSnapshot&) const = default;
};

struct ForeignKeySnapshot {
    std::string column;
    std::string target_table;
    std::string target_column;

    bool operator==(const ForeignKeySnapshot&) const = default;
};

struct TableSnapshot {
    OrderedMap<ColumnSnapshot> columns;
    std::vector<IndexSnapshot> indexes;
    std::vector<ForeignKeySnapshot> foreign_keys;

    bool operator==(const TableSnapshot&) const = default;
};

/**
 * Point-in-time schema description, independent of any live database.
 * JSON form: {version:1, tables:{name:{columns, indexes, foreignKeys}}, enums:{name:[values]}}
 */
struct SchemaSnapshot {
    int version = 1;
    OrderedMap<TableSnapshot> tables;
    OrderedMap<std::vector<std::string>> enums;

    bool operator==(const SchemaSnapshot&) const = default;

    static bool from_json(const jval& doc, SchemaSnapshot& snapshot);
    jdoc to_json() const;

    static SchemaSnapshot parse(const std::string& json_text);
    std::string dump() const;
};

/**
 * Where snapshots live between runs. The key is storage specific
 * (a file path for FileSnapshotStorage).
 */
class SnapshotStorage {
public:
    virtual ~SnapshotStorage() = default;
    virtual std::optional<SchemaSnapshot> load(const std::string& key) = 0;
    virtual void save(const std::string& key, const SchemaSnapshot& snapshot) = 0;
};

class FileSnapshotStorage final : public SnapshotStorage {
public:
    // Missing file -> nullopt. Unreadable or invalid JSON throws.
    std::optional<SchemaSnapshot> load(const std::string& path) override;
    // Pretty JSON; parent directories are created on demand.
    void save(const std::string& path, const SchemaSnapshot& snapshot) override;
};

} // namespace tabula
