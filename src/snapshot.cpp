#include "tabula/snapshot.hpp"
#include <filesystem>

/****************** LITERAL CONSTS */
#define PROP_VERSION      "version"
#define PROP_TABLES       "tables"
#define PROP_ENUMS        "enums"
#define PROP_COLUMNS      "columns"
#define PROP_INDEXES      "indexes"
#define PROP_FOREIGN_KEYS "foreignKeys"
#define PROP_TYPE         "type"
#define PROP_NULLABLE     "nullable"
#define PROP_PRIMARY      "primary"
#define PROP_UNIQUE       "unique"
#define PROP_DEFAULT      "default"
#define PROP_SENSITIVE    "sensitive"
#define PROP_HIDDEN       "hidden"
#define PROP_NAME         "name"
#define PROP_COLUMN       "column"
#define PROP_TARGET_TABLE "targetTable"
#define PROP_TARGET_COL   "targetColumn"

namespace tabula {

namespace {
    bool column_from_json(const jval& obj, ColumnSnapshot& col) {
        if (!obj.IsObject()) return false;
        col.type      = jhlp::get<std::string>(obj, PROP_TYPE);
        col.nullable  = jhlp::get<bool>(obj, PROP_NULLABLE, false);
        col.primary   = jhlp::get<bool>(obj, PROP_PRIMARY, false);
        col.unique    = jhlp::get<bool>(obj, PROP_UNIQUE, false);
        col.sensitive = jhlp::get<bool>(obj, PROP_SENSITIVE, false);
        col.hidden    = jhlp::get<bool>(obj, PROP_HIDDEN, false);
        if (obj.HasMember(PROP_DEFAULT) && !obj[PROP_DEFAULT].IsNull())
            col.default_value = jhlp::dump(obj[PROP_DEFAULT]);
        return !col.type.empty();
    }

    bool table_from_json(const jval& obj, TableSnapshot& table) {
        if (!obj.IsObject()) return false;
        if (obj.HasMember(PROP_COLUMNS)) {
            const jval& cols = obj[PROP_COLUMNS];
            if (!cols.IsObject()) return false;
            for (jit it = cols.MemberBegin(); it != cols.MemberEnd(); ++it) {
                ColumnSnapshot col;
                if (!column_from_json(it->value, col)) {
                    std::cerr << "snapshot: invalid column " << it->name.GetString() << std::endl;
                    return false;
                }
                table.columns.set(it->name.GetString(), std::move(col));
            }
        }
        if (obj.HasMember(PROP_INDEXES) && obj[PROP_INDEXES].IsArray()) {
            for (const auto& ix : obj[PROP_INDEXES].GetArray()) {
                IndexSnapshot idx;
                idx.columns = jhlp::get_strings(ix, PROP_COLUMNS);
                if (ix.HasMember(PROP_NAME) && ix[PROP_NAME].IsString()) idx.name = ix[PROP_NAME].GetString();
                idx.unique = jhlp::get<bool>(ix, PROP_UNIQUE, false);
                if (idx.columns.empty()) return false;
                table.indexes.push_back(std::move(idx));
            }
        }
        if (obj.HasMember(PROP_FOREIGN_KEYS) && obj[PROP_FOREIGN_KEYS].IsArray()) {
            for (const auto& fk : obj[PROP_FOREIGN_KEYS].GetArray()) {
                ForeignKeySnapshot f;
                f.column        = jhlp::get<std::string>(fk, PROP_COLUMN);
                f.target_table  = jhlp::get<std::string>(fk, PROP_TARGET_TABLE);
                f.target_column = jhlp::get<std::string>(fk, PROP_TARGET_COL);
                if (f.column.empty() || f.target_table.empty() || f.target_column.empty()) return false;
                table.foreign_keys.push_back(std::move(f));
            }
        }
        return true;
    }
}

bool SchemaSnapshot::from_json(const jval& doc, SchemaSnapshot& snapshot) {
    if (!doc.IsObject()) return false;
    snapshot = SchemaSnapshot{};
    snapshot.version = jhlp::get<int>(doc, PROP_VERSION, 1);

    if (doc.HasMember(PROP_TABLES)) {
        const jval& tables = doc[PROP_TABLES];
        if (!tables.IsObject()) return false;
        for (jit it = tables.MemberBegin(); it != tables.MemberEnd(); ++it) {
            TableSnapshot t;
            if (!table_from_json(it->value, t)) {
                std::cerr << "snapshot: invalid table " << it->name.GetString() << std::endl;
                return false;
            }
            snapshot.tables.set(it->name.GetString(), std::move(t));
        }
    }
    if (doc.HasMember(PROP_ENUMS)) {
        const jval& enums = doc[PROP_ENUMS];
        if (!enums.IsObject()) return false;
        for (jit it = enums.MemberBegin(); it != enums.MemberEnd(); ++it) {
            if (!it->value.IsArray()) return false;
            std::vector<std::string> values;
            for (const auto& v : it->value.GetArray()) {
                if (!v.IsString()) return false;
                values.emplace_back(v.GetString());
            }
            snapshot.enums.set(it->name.GetString(), std::move(values));
        }
    }
    return true;
}

jdoc SchemaSnapshot::to_json() const {
    jdoc doc;
    doc.SetObject();
    auto& a = doc.GetAllocator();
    doc.AddMember(PROP_VERSION, version, a);

    jval tables(json::kObjectType);
    for (const auto& [tname, table] : this->tables) {
        jval cols(json::kObjectType);
        for (const auto& [cname, col] : table.columns) {
            jval c(json::kObjectType);
            jhlp::set(c, PROP_TYPE, col.type, a);
            jhlp::set(c, PROP_NULLABLE, col.nullable, a);
            jhlp::set(c, PROP_PRIMARY, col.primary, a);
            jhlp::set(c, PROP_UNIQUE, col.unique, a);
            if (col.default_value) jhlp::set(c, PROP_DEFAULT, *col.default_value, a);
            if (col.sensitive) jhlp::set(c, PROP_SENSITIVE, true, a);
            if (col.hidden) jhlp::set(c, PROP_HIDDEN, true, a);
            cols.AddMember(jval(cname.c_str(), a).Move(), c, a);
        }
        jval idxs(json::kArrayType);
        for (const auto& idx : table.indexes) {
            jval i(json::kObjectType);
            i.AddMember(PROP_COLUMNS, jhlp::string_array(idx.columns, a), a);
            if (idx.name) jhlp::set(i, PROP_NAME, *idx.name, a);
            if (idx.unique) jhlp::set(i, PROP_UNIQUE, true, a);
            idxs.PushBack(i, a);
        }
        jval fks(json::kArrayType);
        for (const auto& fk : table.foreign_keys) {
            jval f(json::kObjectType);
            jhlp::set(f, PROP_COLUMN, fk.column, a);
            jhlp::set(f, PROP_TARGET_TABLE, fk.target_table, a);
            jhlp::set(f, PROP_TARGET_COL, fk.target_column, a);
            fks.PushBack(f, a);
        }
        jval t(json::kObjectType);
        t.AddMember(PROP_COLUMNS, cols, a);
        t.AddMember(PROP_INDEXES, idxs, a);
        t.AddMember(PROP_FOREIGN_KEYS, fks, a);
        tables.AddMember(jval(tname.c_str(), a).Move(), t, a);
    }
    doc.AddMember(PROP_TABLES, tables, a);

    jval enums(json::kObjectType);
    for (const auto& [ename, values] : this->enums) {
        enums.AddMember(jval(ename.c_str(), a).Move(), jhlp::string_array(values, a), a);
    }
    doc.AddMember(PROP_ENUMS, enums, a);
    return doc;
}

SchemaSnapshot SchemaSnapshot::parse(const std::string& json_text) {
    jdoc doc;
    if (!jhlp::parse_str(json_text, doc)) TABULA_THROW("snapshot: invalid JSON");
    SchemaSnapshot snap;
    if (!from_json(doc, snap)) TABULA_THROW("snapshot: unexpected document shape");
    return snap;
}

std::string SchemaSnapshot::dump() const {
    return jhlp::pretty(to_json());
}

/* ---------- FileSnapshotStorage ---------- */

std::optional<SchemaSnapshot> FileSnapshotStorage::load(const std::string& path) {
    if (!std::filesystem::exists(path)) return std::nullopt;
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) TABULA_THROW("cannot read snapshot %s", path.c_str());
    SchemaSnapshot snap;
    if (!SchemaSnapshot::from_json(doc, snap)) TABULA_THROW("invalid snapshot document %s", path.c_str());
    return snap;
}

void FileSnapshotStorage::save(const std::string& path, const SchemaSnapshot& snapshot) {
    jdoc doc = snapshot.to_json();
    jhlp::write_file(path, doc);
}

} // namespace tabula
