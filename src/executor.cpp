#include "tabula/executor.hpp"
#include <utility>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    bool looks_like_connection_failure(const std::string& message) {
        const std::string m = to_lower(message);
        for (const char* word : {"connect", "refused", "timeout", "timed out"}) {
            if (m.find(word) != std::string::npos) return true;
        }
        return false;
    }
}

Executor::Executor(QueryFn fn, const SqlDialect& dialect) : fn_(std::move(fn)), dialect_(dialect) {
    if (!fn_) TABULA_THROW("executor needs a query function");
}

QueryResult Executor::execute(const std::string& sql, const Params& params) const {
    try {
        return fn_(sql, params);
    } catch (const DbError&) {
        throw;
    } catch (const BackendError& e) {
        throw_classified(e, sql);
    } catch (const std::exception& e) {
        if (looks_like_connection_failure(e.what())) throw ConnectionError(e.what());
        throw QueryError(e.what(), sql);
    }
}

jval map_row(const jval& row, jdaloc& allocator, const CasingOverrides& overrides) {
    jval out(json::kObjectType);
    if (!row.IsObject()) return out;
    for (jit it = row.MemberBegin(); it != row.MemberEnd(); ++it) {
        jval v(it->value, allocator);
        jhlp::put(out, snake_to_camel(it->name.GetString(), overrides), v, allocator);
    }
    return out;
}

void map_rows(jdoc& rows, const CasingOverrides& overrides) {
    if (!rows.IsArray()) return;
    jdaloc& allocator = rows.GetAllocator();
    for (auto& row : rows.GetArray()) {
        jval mapped = map_row(row, allocator, overrides);
        row = mapped;
    }
}

} // namespace tabula
