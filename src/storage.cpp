#include "tabula/storage.hpp"
#include <algorithm>
#include <utility>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    jdoc first_row(const jdoc& rows) {
        jdoc out;
        if (rows.IsArray() && !rows.Empty()) out.CopyFrom(rows[0], out.GetAllocator());
        else out.SetNull();
        return out;
    }

    std::vector<std::string> merged(std::vector<std::string> a, const std::vector<std::string>& b) {
        for (const auto& x : b) if (std::find(a.begin(), a.end(), x) == a.end()) a.push_back(x);
        return a;
    }

    void set_now(Fields& data, const std::vector<std::string>& columns) {
        for (const auto& col : columns) {
            auto it = std::find_if(data.begin(), data.end(), [&](const auto& f) { return f.first == col; });
            if (it != data.end()) it->second = NOW_SENTINEL;
            else data.emplace_back(col, NOW_SENTINEL);
        }
    }

    int64_t int_member(const jval& row, const char* key) {
        auto it = row.FindMember(key);
        if (it == row.MemberEnd() || it->value.IsNull()) return 0;
        if (it->value.IsInt64()) return it->value.GetInt64();
        if (it->value.IsNumber()) return static_cast<int64_t>(it->value.GetDouble());
        if (it->value.IsString()) return std::stoll(it->value.GetString());
        return 0;
    }
}

Storage::Storage(const Executor& executor, const Registry& registry, CasingOverrides overrides)
    : executor_(executor), registry_(registry), overrides_(std::move(overrides)) {}

const TableDef& Storage::table_def(const std::string& table) const {
    return registry_.at(table).table;
}

Fields Storage::writable(const TableDef& def, const Fields& data) const {
    const auto read_only = def.read_only_columns();
    Fields out;
    for (const auto& f : data) {
        if (std::find(read_only.begin(), read_only.end(), f.first) != read_only.end()) continue;
        out.push_back(f);
    }
    return out;
}

SelectOptions Storage::select_options(const TableDef& def, const FindOptions& o) const {
    SelectOptions sel;
    sel.table = def.name;
    sel.columns = resolve_select_columns(def, o.select);
    sel.where = o.where;
    sel.order_by = o.order_by;
    sel.limit = o.limit;
    sel.offset = o.offset;
    sel.take = o.take;
    sel.cursor = o.cursor;
    sel.overrides = overrides_;
    return sel;
}

/* ---------- reads ---------- */

jdoc Storage::get(const std::string& table, const FindOptions& options) const {
    const TableDef& def = table_def(table);
    SelectOptions sel = select_options(def, options);
    sel.limit = 1;
    sel.take.reset();

    QueryResult res = executor_.execute(executor_.dml().select(sel));
    map_rows(res.rows, overrides_);
    load_relations(executor_, res.rows, res.rows.GetAllocator(), table, options.include, registry_);
    return first_row(res.rows);
}

jdoc Storage::get_or_throw(const std::string& table, const FindOptions& options) const {
    jdoc row = get(table, options);
    if (row.IsNull()) throw NotFoundError(table);
    return row;
}

jdoc Storage::list(const std::string& table, const FindOptions& options) const {
    const TableDef& def = table_def(table);
    QueryResult res = executor_.execute(executor_.dml().select(select_options(def, options)));
    map_rows(res.rows, overrides_);
    load_relations(executor_, res.rows, res.rows.GetAllocator(), table, options.include, registry_);
    return std::move(res.rows);
}

ListResult Storage::list_and_count(const std::string& table, const FindOptions& options) const {
    const TableDef& def = table_def(table);
    SelectOptions sel = select_options(def, options);
    sel.with_count = true;

    QueryResult res = executor_.execute(executor_.dml().select(sel));
    ListResult out;
    if (!res.rows.Empty()) out.total = int_member(res.rows[0], "totalCount");
    for (auto& row : res.rows.GetArray()) {
        row.RemoveMember("totalCount");
        row.RemoveMember("total_count");
    }
    map_rows(res.rows, overrides_);
    load_relations(executor_, res.rows, res.rows.GetAllocator(), table, options.include, registry_);
    out.rows = std::move(res.rows);
    return out;
}

int64_t Storage::count(const std::string& table, const WhereFilter& where) const {
    const TableDef& def = table_def(table);
    QueryResult res = executor_.execute(build_count(def.name, where, executor_.dialect(), overrides_));
    if (res.rows.Empty()) return 0;
    return int_member(res.rows[0], "count");
}

jdoc Storage::aggregate(const std::string& table, const WhereFilter& where, const AggregateSpec& spec) const {
    jdoc out;
    out.SetObject();
    if (spec.empty()) return out;

    const TableDef& def = table_def(table);
    QueryResult res = executor_.execute(build_aggregate(def.name, where, spec, executor_.dialect(), overrides_));
    if (res.rows.Empty()) return out;
    jval shaped = restructure_aggregate(res.rows[0], spec, {}, out.GetAllocator(), overrides_);
    static_cast<jval&>(out) = shaped;
    return out;
}

jdoc Storage::group_by(const GroupByOptions& options) const {
    GroupByOptions o = options;
    o.table = table_def(options.table).name;
    if (o.overrides.empty()) o.overrides = overrides_;

    QueryResult res = executor_.execute(build_group_by(o, executor_.dialect()));
    jdoc out;
    out.SetArray();
    for (const auto& row : res.rows.GetArray()) {
        out.PushBack(restructure_aggregate(row, o.aggregate, o.by, out.GetAllocator(), o.overrides),
                     out.GetAllocator());
    }
    return out;
}

/* ---------- writes ---------- */

jdoc Storage::create(const std::string& table, const Fields& data, const Selection& select) const {
    const TableDef& def = table_def(table);
    InsertOptions ins;
    ins.table = def.name;
    ins.rows = {writable(def, data)};
    ins.returning = true;
    ins.returning_columns = resolve_select_columns(def, select);
    ins.now_columns = def.timestamp_columns();
    ins.overrides = overrides_;

    QueryResult res = executor_.execute(executor_.dml().insert(ins));
    map_rows(res.rows, overrides_);
    return first_row(res.rows);
}

int64_t Storage::create_many(const std::string& table, const std::vector<Fields>& rows) const {
    if (rows.empty()) return 0;
    const TableDef& def = table_def(table);
    InsertOptions ins;
    ins.table = def.name;
    for (const auto& r : rows) ins.rows.push_back(writable(def, r));
    ins.now_columns = def.timestamp_columns();
    ins.overrides = overrides_;
    return executor_.execute(executor_.dml().insert(ins)).row_count;
}

jdoc Storage::create_many_and_return(const std::string& table, const std::vector<Fields>& rows,
                                     const Selection& select) const {
    jdoc out;
    out.SetArray();
    if (rows.empty()) return out;

    const TableDef& def = table_def(table);
    InsertOptions ins;
    ins.table = def.name;
    for (const auto& r : rows) ins.rows.push_back(writable(def, r));
    ins.returning = true;
    ins.returning_columns = resolve_select_columns(def, select);
    ins.now_columns = def.timestamp_columns();
    ins.overrides = overrides_;

    QueryResult res = executor_.execute(executor_.dml().insert(ins));
    map_rows(res.rows, overrides_);
    return std::move(res.rows);
}

jdoc Storage::update(const std::string& table, const WhereFilter& where, const Fields& data,
                     const Selection& select) const {
    const TableDef& def = table_def(table);
    UpdateOptions upd;
    upd.table = def.name;
    upd.data = writable(def, data);
    set_now(upd.data, def.auto_update_columns());
    upd.where = where;
    upd.returning = true;
    upd.returning_columns = resolve_select_columns(def, select);
    upd.now_columns = merged(def.timestamp_columns(), def.auto_update_columns());
    upd.overrides = overrides_;

    QueryResult res = executor_.execute(executor_.dml().update(upd));
    if (res.rows.Empty()) throw NotFoundError(table);
    map_rows(res.rows, overrides_);
    return first_row(res.rows);
}

int64_t Storage::update_many(const std::string& table, const WhereFilter& where, const Fields& data) const {
    assert_non_empty_where(where, "updateMany");
    const TableDef& def = table_def(table);
    UpdateOptions upd;
    upd.table = def.name;
    upd.data = writable(def, data);
    set_now(upd.data, def.auto_update_columns());
    upd.where = where;
    upd.now_columns = merged(def.timestamp_columns(), def.auto_update_columns());
    upd.overrides = overrides_;
    return executor_.execute(executor_.dml().update(upd)).row_count;
}

jdoc Storage::upsert(const std::string& table, const Fields& where, const Fields& create,
                     const Fields& update, const Selection& select) const {
    if (where.empty()) throw QueryError("upsert on " + table + " needs at least one conflict column");
    const TableDef& def = table_def(table);

    Fields row = writable(def, create);
    for (const auto& f : where) if (!find_field(row, f.first)) row.push_back(f);

    Fields changes = writable(def, update);
    if (!changes.empty()) set_now(changes, def.auto_update_columns());

    InsertOptions ins;
    ins.table = def.name;
    ins.rows = {row};
    ins.returning = true;
    ins.returning_columns = resolve_select_columns(def, select);
    ins.now_columns = merged(def.timestamp_columns(), def.auto_update_columns());
    ins.overrides = overrides_;

    OnConflict oc;
    for (const auto& f : where) oc.columns.push_back(f.first);
    oc.action = changes.empty() ? OnConflict::Action::Nothing : OnConflict::Action::Update;
    for (const auto& f : changes) oc.update_columns.push_back(f.first);
    oc.update_values = changes;
    ins.on_conflict = oc;

    QueryResult res = executor_.execute(executor_.dml().insert(ins));
    if (res.rows.Empty()) {
        // DO NOTHING returns no row on conflict; read the existing one.
        std::vector<WhereFilter> keys;
        for (const auto& [col, v] : where) keys.push_back(WhereFilter::eq(col, v));
        FindOptions find;
        find.where = WhereFilter::all(std::move(keys));
        find.select = select;
        return get(table, find);
    }
    map_rows(res.rows, overrides_);
    return first_row(res.rows);
}

jdoc Storage::delete_one(const std::string& table, const WhereFilter& where, const Selection& select) const {
    const TableDef& def = table_def(table);
    DeleteOptions del;
    del.table = def.name;
    del.where = where;
    del.returning = true;
    del.returning_columns = resolve_select_columns(def, select);
    del.overrides = overrides_;

    QueryResult res = executor_.execute(executor_.dml().remove(del));
    if (res.rows.Empty()) throw NotFoundError(table);
    map_rows(res.rows, overrides_);
    return first_row(res.rows);
}

int64_t Storage::delete_many(const std::string& table, const WhereFilter& where) const {
    assert_non_empty_where(where, "deleteMany");
    const TableDef& def = table_def(table);
    DeleteOptions del;
    del.table = def.name;
    del.where = where;
    del.overrides = overrides_;
    return executor_.execute(executor_.dml().remove(del)).row_count;
}

} // namespace tabula
