#include "tabula/table.hpp"
#include <algorithm>
#include "tabula/lib.hpp"

namespace tabula {

const ColumnDef* TableDef::column(const std::string& col) const {
    for (const auto& c : columns) if (c.name == col) return &c;
    return nullptr;
}

std::string TableDef::primary_key() const {
    for (const auto& c : columns) if (c.primary) return c.name;
    if (column("id")) return "id";
    TABULA_THROW("Table: '%s' has no primary key", name.c_str());
}

std::vector<std::string> TableDef::timestamp_columns() const {
    std::vector<std::string> out;
    for (const auto& c : columns) if (c.default_kind == DefaultKind::Now) out.push_back(c.name);
    return out;
}

std::vector<std::string> TableDef::read_only_columns() const {
    std::vector<std::string> out;
    for (const auto& c : columns) if (c.read_only) out.push_back(c.name);
    return out;
}

std::vector<std::string> TableDef::auto_update_columns() const {
    std::vector<std::string> out;
    for (const auto& c : columns) if (c.auto_update) out.push_back(c.name);
    return out;
}

bool TableDef::from_json(const jval& j, TableDef& table) {
    if (!j.IsObject()) return false;
    table.name = jhlp::get<std::string>(j, PROP_NAME);
    if (table.name.empty()) return false;

    table.columns.clear();
    if (!j.HasMember(PROP_PROPERTIES) || !j[PROP_PROPERTIES].IsObject()) return false;
    const jval& props = j[PROP_PROPERTIES];
    for (jit itprop = props.MemberBegin(); itprop != props.MemberEnd(); ++itprop) {
        ColumnDef field;
        field.name = itprop->name.GetString();
        const jval& prop = itprop->value;
        field.type        = jhlp::get<std::string>(prop, PROP_TYPE);
        field.primary     = jhlp::get<bool>(prop, PROP_PRIMARY);
        field.unique      = jhlp::get<bool>(prop, PROP_UNIQUE);
        field.nullable    = jhlp::get<bool>(prop, PROP_NULLABLE);
        field.sensitive   = jhlp::get<bool>(prop, PROP_SENSITIVE);
        field.hidden      = jhlp::get<bool>(prop, PROP_HIDDEN);
        field.read_only   = jhlp::get<bool>(prop, PROP_READ_ONLY);
        field.auto_update = jhlp::get<bool>(prop, PROP_AUTO_UPDATE);
        field.enum_values = jhlp::get_strings(prop, PROP_ENUM);
        if (!field.enum_values.empty()) {
            field.enum_name = jhlp::get<std::string>(prop, PROP_ENUM_NAME, field.name);
            if (field.type.empty()) field.type = field.enum_name;
        }
        if (field.type.empty()) {
            std::cerr << "Table '" << table.name << "': column '" << field.name << "' has no type" << std::endl;
            return false;
        }

        if (prop.HasMember(PROP_DEFAULT)) {
            const jval& def = prop[PROP_DEFAULT];
            if (def.IsNull()) {
                field.default_kind  = DefaultKind::Raw;
                field.default_value = VAL_NULL;
            } else if (def.IsString()) {
                field.default_value = def.GetString(); // unquoted text
                field.default_kind  = field.default_value == VAL_NOW ? DefaultKind::Now : DefaultKind::String;
            } else if (def.IsBool()) {
                field.default_kind  = DefaultKind::Boolean;
                field.default_value = def.GetBool() ? "TRUE" : "FALSE";
            } else if (def.IsNumber()) {
                field.default_kind  = DefaultKind::Number;
                field.default_value = jhlp::dump(def);
            } else if (def.IsObject() && def.HasMember("sql") && def["sql"].IsString()) {
                // {"sql": "gen_random_uuid()"}: expression taken verbatim
                field.default_kind  = DefaultKind::Raw;
                field.default_value = def["sql"].GetString();
            } else {
                field.default_kind  = DefaultKind::String;
                field.default_value = jhlp::dump(def);
            }
        }
        table.columns.push_back(std::move(field));
    }

    table.indexes.clear();
    if (j.HasMember(PROP_INDEXES) && j[PROP_INDEXES].IsArray()) {
        for (const auto& idx : j[PROP_INDEXES].GetArray()) {
            IndexDef index;
            index.fields = jhlp::get_strings(idx, PROP_FIELDS);
            index.unique = jhlp::get<bool>(idx, PROP_UNIQUE);
            index.index_name = jhlp::get<std::string>(idx, PROP_INDEX_NAME);
            if (index.fields.empty()) return false;
            table.indexes.push_back(std::move(index));
        }
    }

    table.foreign_keys.clear();
    if (j.HasMember(PROP_FOREIGN_KEYS) && j[PROP_FOREIGN_KEYS].IsArray()) {
        for (const auto& fk : j[PROP_FOREIGN_KEYS].GetArray()) {
            ForeignKeySnapshot f;
            f.column        = jhlp::get<std::string>(fk, "column");
            f.target_table  = jhlp::get<std::string>(fk, "targetTable");
            f.target_column = jhlp::get<std::string>(fk, "targetColumn", "id");
            if (f.column.empty() || f.target_table.empty()) return false;
            table.foreign_keys.push_back(std::move(f));
        }
    }
    return true;
}

std::vector<std::string> resolve_select_columns(const TableDef& table, const Selection& selection) {
    if (!selection.fields.empty()) return selection.fields;
    std::vector<std::string> out;
    for (const auto& c : table.columns) {
        if (c.hidden) continue;
        if (selection.exclude_sensitive && c.sensitive) continue;
        out.push_back(c.name);
    }
    return out;
}

std::optional<std::string> snapshot_default(const ColumnDef& c) {
    switch (c.default_kind) {
        case DefaultKind::None:    return std::nullopt;
        case DefaultKind::String:  return quote_literal(c.default_value);
        case DefaultKind::Boolean:
        case DefaultKind::Number:
        case DefaultKind::Raw:     return c.default_value;
        case DefaultKind::Now:     return std::string("now()");
    }
    return std::nullopt;
}

SchemaSnapshot create_snapshot(const std::vector<TableDef>& tables) {
    SchemaSnapshot snap;
    for (const auto& t : tables) {
        TableSnapshot ts;
        for (const auto& c : t.columns) {
            ColumnSnapshot cs;
            cs.type          = c.type;
            cs.nullable      = c.nullable;
            cs.primary       = c.primary;
            cs.unique        = c.unique;
            cs.default_value = snapshot_default(c);
            cs.sensitive     = c.sensitive;
            cs.hidden        = c.hidden;
            ts.columns.set(c.name, std::move(cs));
            if (!c.enum_values.empty() && !snap.enums.contains(c.enum_name))
                snap.enums.set(c.enum_name, c.enum_values);
        }
        for (const auto& i : t.indexes) {
            IndexSnapshot is;
            is.columns = i.fields;
            is.unique = i.unique;
            if (!i.index_name.empty()) is.name = i.index_name;
            ts.indexes.push_back(std::move(is));
        }
        ts.foreign_keys = t.foreign_keys;
        snap.tables.set(t.name, std::move(ts));
    }
    return snap;
}

/* ---------- relations ---------- */

RelationDef RelationDef::one(std::string target, std::string foreign_key) {
    RelationDef r;
    r.kind = Kind::One;
    r.target = std::move(target);
    r.foreign_key = std::move(foreign_key);
    return r;
}

RelationDef RelationDef::many(std::string target, std::string foreign_key) {
    RelationDef r;
    r.kind = Kind::Many;
    r.target = std::move(target);
    r.foreign_key = std::move(foreign_key);
    return r;
}

RelationDef RelationDef::many_through(std::string target, std::string join_table,
                                      std::string this_key, std::string that_key) {
    RelationDef r;
    r.kind = Kind::Many;
    r.target = std::move(target);
    r.through = Through{std::move(join_table), std::move(this_key), std::move(that_key)};
    return r;
}

void Registry::add(TableDef table, OrderedMap<RelationDef> relations) {
    std::string key = table.name;
    entries_.set(key, RegistryEntry{std::move(table), std::move(relations)});
}

bool Registry::from_json(const jval& doc, Registry& registry) {
    if (!doc.IsArray()) return false;
    for (const auto& t : doc.GetArray()) {
        TableDef table;
        if (!TableDef::from_json(t, table)) return false;
        OrderedMap<RelationDef> relations;
        if (t.HasMember(PROP_RELATIONS) && t[PROP_RELATIONS].IsObject()) {
            const jval& rels = t[PROP_RELATIONS];
            for (jit it = rels.MemberBegin(); it != rels.MemberEnd(); ++it) {
                const jval& r = it->value;
                const std::string kind   = jhlp::get<std::string>(r, PROP_TYPE, "one");
                const std::string target = jhlp::get<std::string>(r, "target");
                if (target.empty()) return false;
                if (r.HasMember("through") && r["through"].IsObject()) {
                    const jval& th = r["through"];
                    relations.set(it->name.GetString(),
                                  RelationDef::many_through(target,
                                                            jhlp::get<std::string>(th, "table"),
                                                            jhlp::get<std::string>(th, "thisKey"),
                                                            jhlp::get<std::string>(th, "thatKey")));
                } else if (kind == "many") {
                    relations.set(it->name.GetString(),
                                  RelationDef::many(target, jhlp::get<std::string>(r, "foreignKey")));
                } else {
                    relations.set(it->name.GetString(),
                                  RelationDef::one(target, jhlp::get<std::string>(r, "foreignKey")));
                }
            }
        }
        registry.add(std::move(table), std::move(relations));
    }
    return true;
}

const RegistryEntry* Registry::find(const std::string& table) const {
    return entries_.find(table);
}

const RegistryEntry& Registry::at(const std::string& table) const {
    const RegistryEntry* e = find(table);
    if (!e) TABULA_THROW("Registry: unknown table '%s'", table.c_str());
    return *e;
}

std::vector<TableDef> Registry::tables() const {
    std::vector<TableDef> out;
    for (const auto& [name, entry] : entries_) out.push_back(entry.table);
    return out;
}

} // namespace tabula
