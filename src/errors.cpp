#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

DbError::DbError(std::string code, const std::string& message,
                 std::optional<std::string> table, std::optional<std::string> query)
    : std::runtime_error(message), code_(std::move(code)),
      table_(std::move(table)), query_(std::move(query)) {}

jdoc DbError::to_json() const {
    jdoc doc;
    doc.SetObject();
    jhlp::set(doc, "error", name());
    jhlp::set(doc, "code", code_);
    jhlp::set(doc, "message", std::string(what()));
    if (table_) jhlp::set(doc, "table", *table_);
    return doc;
}

/* ---------- ConstraintError ---------- */

namespace {
    const char* constraint_code(ConstraintKind k) {
        switch (k) {
            case ConstraintKind::Unique:     return "UNIQUE_VIOLATION";
            case ConstraintKind::ForeignKey: return "FOREIGN_KEY_VIOLATION";
            case ConstraintKind::NotNull:    return "NOT_NULL_VIOLATION";
            case ConstraintKind::Check:      return "CHECK_VIOLATION";
        }
        return "CONSTRAINT_VIOLATION";
    }

    std::string constraint_message(const ConstraintInfo& i) {
        switch (i.kind) {
            case ConstraintKind::Unique:
                return "Unique constraint violated on " + i.table + "." + i.column +
                       (i.value ? " (value: " + *i.value + ")" : std::string());
            case ConstraintKind::ForeignKey:
                return "Foreign key constraint \"" + i.constraint + "\" violated on table " + i.table;
            case ConstraintKind::NotNull:
                return "Not-null constraint violated on " + i.table + "." + i.column;
            case ConstraintKind::Check:
                return "Check constraint \"" + i.constraint + "\" violated on table " + i.table;
        }
        return "Constraint violated on table " + i.table;
    }
}

ConstraintError::ConstraintError(ConstraintInfo info, std::optional<std::string> query)
    : DbError(constraint_code(info.kind), constraint_message(info), info.table, std::move(query)),
      info_(std::move(info)) {}

std::string ConstraintError::name() const {
    switch (info_.kind) {
        case ConstraintKind::Unique:     return "UniqueConstraintError";
        case ConstraintKind::ForeignKey: return "ForeignKeyError";
        case ConstraintKind::NotNull:    return "NotNullError";
        case ConstraintKind::Check:      return "CheckConstraintError";
    }
    return "ConstraintError";
}

jdoc ConstraintError::to_json() const {
    jdoc doc = DbError::to_json();
    if (info_.kind == ConstraintKind::Unique || info_.kind == ConstraintKind::NotNull)
        jhlp::set(doc, "column", info_.column);
    return doc;
}

NotFoundError::NotFoundError(const std::string& table, std::optional<std::string> query)
    : DbError("NOT_FOUND", "Record not found in table " + table, table, std::move(query)) {}

ConnectionError::ConnectionError(const std::string& message)
    : DbError("CONNECTION_ERROR", message) {}

QueryError::QueryError(const std::string& message, std::optional<std::string> sql)
    : DbError("QUERY_ERROR", message, std::nullopt, std::move(sql)) {}

MigrationError::MigrationError(const std::string& message, std::optional<std::string> sql,
                               std::optional<std::string> cause)
    : DbError("MIGRATION_ERROR", cause ? message + ": " + *cause : message, std::nullopt, std::move(sql)),
      cause_(std::move(cause)) {}

/* ---------- message parsing ---------- */

namespace {
    // Text between the first `open` after `after` and the next `close`.
    std::optional<std::string> between(const std::string& s, const std::string& after,
                                       char open, char close) {
        size_t p = s.find(after);
        if (p == std::string::npos) return std::nullopt;
        p = s.find(open, p + after.size());
        if (p == std::string::npos) return std::nullopt;
        size_t e = s.find(close, p + 1);
        if (e == std::string::npos) return std::nullopt;
        return s.substr(p + 1, e - p - 1);
    }

    // "UNIQUE constraint failed: users.email, users.org" -> {users, email}
    std::pair<std::string, std::string> sqlite_target(const std::string& msg) {
        size_t p = msg.find("failed: ");
        if (p == std::string::npos) return {"unknown", "unknown"};
        std::string rest = msg.substr(p + 8);
        if (auto c = rest.find(','); c != std::string::npos) rest = rest.substr(0, c);
        rest = trim(rest);
        auto dot = rest.find('.');
        if (dot == std::string::npos) return {"unknown", rest};
        return {rest.substr(0, dot), rest.substr(dot + 1)};
    }

    bool is_pg_connection_code(const std::string& code) {
        return code.rfind("08", 0) == 0 || code.rfind("28", 0) == 0 ||
               code == "57P01" || code == "57P02" || code == "57P03";
    }

    bool is_sqlite_connection_code(const std::string& code) {
        return code.rfind("SQLITE_CANTOPEN", 0) == 0 || code.rfind("SQLITE_NOTADB", 0) == 0 ||
               code.rfind("SQLITE_IOERR", 0) == 0 || code == "SQLITE_AUTH";
    }

    [[noreturn]] void throw_pg(const BackendError& e, const std::string& sql) {
        const std::string& code = e.vendor_code;
        const std::string msg = e.what();
        ConstraintInfo info;
        info.pg_code = code;
        info.detail = e.detail;

        if (code == "23505") {
            info.kind = ConstraintKind::Unique;
            info.table = e.table.value_or("unknown");
            auto kv = e.detail ? parse_pg_key_detail(*e.detail) : std::nullopt;
            info.column = e.column ? *e.column : (kv ? kv->first : "unknown");
            if (kv) info.value = kv->second;
            info.constraint = e.constraint.value_or("");
            throw ConstraintError(info, sql);
        }
        if (code == "23503") {
            info.kind = ConstraintKind::ForeignKey;
            info.table = e.table.value_or("unknown");
            info.constraint = e.constraint.value_or("unknown");
            throw ConstraintError(info, sql);
        }
        if (code == "23502") {
            info.kind = ConstraintKind::NotNull;
            info.column = e.column ? *e.column : between(msg, "column", '"', '"').value_or("unknown");
            info.table = e.table ? *e.table : between(msg, "relation", '"', '"').value_or("unknown");
            throw ConstraintError(info, sql);
        }
        if (code == "23514") {
            info.kind = ConstraintKind::Check;
            info.table = e.table ? *e.table : between(msg, "relation", '"', '"').value_or("unknown");
            info.constraint = e.constraint ? *e.constraint
                                           : between(msg, "check constraint", '"', '"').value_or("unknown");
            throw ConstraintError(info, sql);
        }
        if (is_pg_connection_code(code)) throw ConnectionError(msg);
        throw QueryError(msg, sql);
    }

    [[noreturn]] void throw_sqlite(const BackendError& e, const std::string& sql) {
        const std::string& code = e.vendor_code;
        const std::string msg = e.what();
        ConstraintInfo info;

        if (code == "SQLITE_CONSTRAINT_UNIQUE" || code == "SQLITE_CONSTRAINT_PRIMARYKEY") {
            auto [table, column] = sqlite_target(msg);
            info.kind = ConstraintKind::Unique;
            info.table = e.table.value_or(table);
            info.column = e.column.value_or(column);
            throw ConstraintError(info, sql);
        }
        if (code == "SQLITE_CONSTRAINT_FOREIGNKEY") {
            info.kind = ConstraintKind::ForeignKey;
            info.table = e.table.value_or("unknown");
            info.constraint = e.constraint.value_or("unknown");
            throw ConstraintError(info, sql);
        }
        if (code == "SQLITE_CONSTRAINT_NOTNULL") {
            auto [table, column] = sqlite_target(msg);
            info.kind = ConstraintKind::NotNull;
            info.table = e.table.value_or(table);
            info.column = e.column.value_or(column);
            throw ConstraintError(info, sql);
        }
        if (code == "SQLITE_CONSTRAINT_CHECK") {
            info.kind = ConstraintKind::Check;
            info.table = e.table.value_or("unknown");
            auto p = msg.find("failed: ");
            info.constraint = e.constraint ? *e.constraint
                                           : (p == std::string::npos ? "unknown" : trim(msg.substr(p + 8)));
            throw ConstraintError(info, sql);
        }
        if (is_sqlite_connection_code(code)) throw ConnectionError(msg);
        throw QueryError(msg, sql);
    }
}

std::optional<std::pair<std::string, std::string>> parse_pg_key_detail(const std::string& detail) {
    auto column = between(detail, "Key", '(', ')');
    if (!column) return std::nullopt;
    size_t p = detail.find(")=(");
    if (p == std::string::npos) return std::nullopt;
    size_t e = detail.rfind(')');
    if (e == std::string::npos || e <= p + 3) return std::nullopt;
    return std::make_pair(*column, detail.substr(p + 3, e - p - 3));
}

void throw_classified(const BackendError& e, const std::string& sql) {
    if (e.dialect == Dialect::Postgres) throw_pg(e, sql);
    throw_sqlite(e, sql);
}

} // namespace tabula
