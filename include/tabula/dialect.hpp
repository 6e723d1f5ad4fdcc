#pragma once
#include <string>

namespace tabula {

enum class Dialect {SQLite, Postgres};

/**
 * Backend capability profile injected into every builder.
 * - Placeholder style:
 *     SQLite   -> ?1, ?2, ...
 *     Postgres -> $1, $2, ...
 *   Both are numbered so WHERE fragments built at an offset compose.
 * - Unsupported features fail through the require_*() methods; builders never
 *   fall back to different SQL.
 */
class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    virtual Dialect kind() const = 0;
    virtual std::string name() const = 0;

    // 1-based placeholder
    virtual std::string param(size_t index1) const = 0;

    // current-timestamp expression in DML
    virtual std::string now() const = 0;
    // current-timestamp expression usable after DEFAULT in DDL
    virtual std::string now_default() const = 0;

    // canonical column type -> backend column type
    virtual std::string map_type(const std::string& type) const = 0;

    virtual bool supports_returning() const = 0;
    virtual bool supports_array_ops() const = 0;
    virtual bool supports_json_path() const = 0;
    virtual bool supports_native_enums() const = 0;
    virtual bool supports_alter_column() const = 0;

    void require_array_ops() const;
    void require_json_path() const;
    void require_returning() const;
};

class PgDialect final : public SqlDialect {
public:
    Dialect kind() const override { return Dialect::Postgres; }
    std::string name() const override { return "postgres"; }
    std::string param(size_t index1) const override; // $1
    std::string now() const override { return "NOW()"; }
    std::string now_default() const override { return "now()"; }
    std::string map_type(const std::string& type) const override { return type; }
    bool supports_returning() const override { return true; }
    bool supports_array_ops() const override { return true; }
    bool supports_json_path() const override { return true; }
    bool supports_native_enums() const override { return true; }
    bool supports_alter_column() const override { return true; }
};

class SqliteDialect final : public SqlDialect {
public:
    Dialect kind() const override { return Dialect::SQLite; }
    std::string name() const override { return "sqlite"; }
    std::string param(size_t index1) const override; // ?1
    std::string now() const override { return "datetime('now')"; }
    std::string now_default() const override { return "(datetime('now'))"; }
    std::string map_type(const std::string& type) const override;
    bool supports_returning() const override { return true; }
    bool supports_array_ops() const override { return false; }
    bool supports_json_path() const override { return false; }
    bool supports_native_enums() const override { return false; }
    bool supports_alter_column() const override { return false; }
};

const SqlDialect& pg_dialect();
const SqlDialect& sqlite_dialect();
const SqlDialect& dialect_for(Dialect dialect);

// "postgres" / "postgresql" / "pg" / "sqlite"; throws on anything else
Dialect parse_dialect(const std::string& name);

} // namespace tabula
