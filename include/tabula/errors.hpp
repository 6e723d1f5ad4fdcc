#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include "tabula/dialect.hpp"
#include "tabula/jsonhlp.hpp"

namespace tabula {

/**
 * Root of the structured database error taxonomy.
 * Raised by the Executor after a backend failure was classified, and directly by
 * builders for guard violations (empty WHERE, bad ORDER BY, missing capability).
 */
class DbError : public std::runtime_error {
public:
    DbError(std::string code, const std::string& message,
            std::optional<std::string> table = std::nullopt,
            std::optional<std::string> query = std::nullopt);

    const std::string& code() const noexcept { return code_; }
    const std::optional<std::string>& table() const noexcept { return table_; }
    const std::optional<std::string>& query() const noexcept { return query_; }

    virtual std::string name() const { return "DbError"; }

    // {error, code, message, table?, column?}
    virtual jdoc to_json() const;

protected:
    std::string code_;
    std::optional<std::string> table_;
    std::optional<std::string> query_;
};

enum class ConstraintKind { Unique, ForeignKey, NotNull, Check };

struct ConstraintInfo {
    ConstraintKind kind = ConstraintKind::Unique;
    std::string table;
    std::string column;
    std::string constraint;
    std::optional<std::string> value;
    std::optional<std::string> detail;
    std::optional<std::string> pg_code;
};

class ConstraintError : public DbError {
public:
    explicit ConstraintError(ConstraintInfo info, std::optional<std::string> query = std::nullopt);

    ConstraintKind kind() const noexcept { return info_.kind; }
    const std::string& column() const noexcept { return info_.column; }
    const std::string& constraint() const noexcept { return info_.constraint; }
    const std::optional<std::string>& value() const noexcept { return info_.value; }
    const std::optional<std::string>& detail() const noexcept { return info_.detail; }
    const std::optional<std::string>& pg_code() const noexcept { return info_.pg_code; }

    std::string name() const override;
    jdoc to_json() const override;

private:
    ConstraintInfo info_;
};

class NotFoundError : public DbError {
public:
    explicit NotFoundError(const std::string& table, std::optional<std::string> query = std::nullopt);
    std::string name() const override { return "NotFoundError"; }
};

class ConnectionError : public DbError {
public:
    explicit ConnectionError(const std::string& message);
    std::string name() const override { return "ConnectionError"; }
};

class QueryError : public DbError {
public:
    explicit QueryError(const std::string& message, std::optional<std::string> sql = std::nullopt);
    std::string name() const override { return "QueryError"; }
};

class MigrationError : public DbError {
public:
    MigrationError(const std::string& message,
                   std::optional<std::string> sql = std::nullopt,
                   std::optional<std::string> cause = std::nullopt);
    const std::optional<std::string>& cause() const noexcept { return cause_; }
    std::string name() const override { return "MigrationError"; }

private:
    std::optional<std::string> cause_;
};

/**
 * Raw driver failure. Connections throw this; the Executor turns it into a DbError.
 * vendor_code is the SQLSTATE on Postgres and the extended result code name
 * (SQLITE_CONSTRAINT_UNIQUE, ...) on SQLite.
 */
class BackendError : public std::runtime_error {
public:
    BackendError(Dialect dialect, std::string vendor_code, const std::string& message)
        : std::runtime_error(message), dialect(dialect), vendor_code(std::move(vendor_code)) {}

    Dialect dialect;
    std::string vendor_code;
    int native_code = 0;
    std::optional<std::string> detail;
    std::optional<std::string> table;
    std::optional<std::string> column;
    std::optional<std::string> constraint;
};

// Key (email)=(a@b.c) already exists. -> {email, a@b.c}
std::optional<std::pair<std::string, std::string>> parse_pg_key_detail(const std::string& detail);

// Throws the DbError that matches a backend failure.
[[noreturn]] void throw_classified(const BackendError& e, const std::string& sql);

} // namespace tabula
