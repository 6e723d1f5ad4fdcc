#pragma once
#include <optional>
#include <string>
#include <vector>
#include "tabula/jsonhlp.hpp"
#include "tabula/snapshot.hpp"

/****************** LITERAL CONSTS */
#define VAL_NULL         "NULL"
#define VAL_NOW          "now"
#define PROP_NAME        "name"
#define PROP_PROPERTIES  "properties"
#define PROP_TYPE        "type"
#define PROP_PRIMARY     "primary"
#define PROP_UNIQUE      "unique"
#define PROP_NULLABLE    "nullable"
#define PROP_DEFAULT     "default"
#define PROP_SENSITIVE   "sensitive"
#define PROP_HIDDEN      "hidden"
#define PROP_READ_ONLY   "readOnly"
#define PROP_AUTO_UPDATE "autoUpdate"
#define PROP_ENUM        "enum"
#define PROP_ENUM_NAME   "enumName"
#define PROP_INDEXES     "indexes"
#define PROP_FIELDS      "fields"
#define PROP_INDEX_NAME  "indexName"
#define PROP_FOREIGN_KEYS "foreignKeys"
#define PROP_RELATIONS   "relations"

namespace tabula {

/**********  column and table definitions  ***********/
enum class DefaultKind { None, String, Boolean, Number, Raw, Now };

struct ColumnDef {
    std::string name;                  // declared (camelCase) name
    std::string type;                  // canonical type, or the enum name for enum columns
    bool        primary = false;
    bool        unique = false;
    bool        nullable = false;
    std::string default_value;         // unquoted text for DefaultKind::String
    DefaultKind default_kind = DefaultKind::None;
    bool        sensitive = false;     // excluded from reads that ask for it
    bool        hidden = false;        // never selected by default
    bool        read_only = false;     // ignored on create/update payloads
    bool        auto_update = false;   // set to now on every update
    std::string enum_name;
    std::vector<std::string> enum_values;
};

struct IndexDef {
    std::vector<std::string> fields;
    bool unique = false;
    std::string index_name;
};

class TableDef {
public:
    std::string name;                  // storage table name
    std::vector<ColumnDef> columns;
    std::vector<IndexDef> indexes;
    std::vector<ForeignKeySnapshot> foreign_keys;

    const ColumnDef* column(const std::string& name) const;

    // First primary column, falling back to a column named "id".
    std::string primary_key() const;

    // Columns whose default is the current timestamp.
    std::vector<std::string> timestamp_columns() const;
    std::vector<std::string> read_only_columns() const;
    std::vector<std::string> auto_update_columns() const;

    // {name, properties:{col:{type, primary, unique, nullable, default, ...}}, indexes, foreignKeys}
    static bool from_json(const jval& doc, TableDef& table);
};

// Narrowing for reads. Empty fields means "every visible column".
struct Selection {
    std::vector<std::string> fields;
    bool exclude_sensitive = false;
};

std::vector<std::string> resolve_select_columns(const TableDef& table, const Selection& selection = {});

// SQL default expression for a column definition, e.g. 'draft', TRUE, now()
std::optional<std::string> snapshot_default(const ColumnDef& column);

// Builds the current snapshot from declared tables. Enum values come from enum columns.
SchemaSnapshot create_snapshot(const std::vector<TableDef>& tables);

/**********  relations and registry  ***********/

struct RelationDef {
    enum class Kind { One, Many };

    struct Through {
        std::string table;     // join table
        std::string this_key;  // join column pointing at the owning table
        std::string that_key;  // join column pointing at the target table
    };

    Kind kind = Kind::One;
    std::string target;        // target table name, resolved through the Registry
    std::string foreign_key;   // One: column on the owner. Many: column on the target.
    std::optional<Through> through;

    static RelationDef one(std::string target, std::string foreign_key);
    static RelationDef many(std::string target, std::string foreign_key);
    static RelationDef many_through(std::string target, std::string join_table,
                                    std::string this_key, std::string that_key);
};

struct RegistryEntry {
    TableDef table;
    OrderedMap<RelationDef> relations;
};

/**
 * Table definitions plus their relations, keyed by table name.
 * Built once and handed by const reference to every loader call.
 */
class Registry {
public:
    void add(TableDef table, OrderedMap<RelationDef> relations = {});

    // Loads an array of table documents (TableDef::from_json plus "relations").
    static bool from_json(const jval& doc, Registry& registry);

    const RegistryEntry* find(const std::string& table) const;
    const RegistryEntry& at(const std::string& table) const;

    std::vector<TableDef> tables() const;
    SchemaSnapshot snapshot() const { return create_snapshot(tables()); }

private:
    OrderedMap<RegistryEntry> entries_;
};

} // namespace tabula
