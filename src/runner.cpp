#include "tabula/runner.hpp"
#include <algorithm>
#include <format>
#include <iostream>
#include <memory>
#include <regex>
#include <set>
#include <openssl/evp.h>
#include "tabula/errors.hpp"
#include "tabula/lib.hpp"

namespace tabula {

namespace {
    struct evp_md_ctx_deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) EVP_MD_CTX_free(ctx);
        }
    };
    using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

    const std::string HISTORY = quote_ident(TABULA_HISTORY_TABLE);

    int64_t sequence_of(const std::string& name, const std::vector<MigrationFile>& files) {
        for (const auto& f : files) if (f.name == name) return f.sequence;
        auto parsed = parse_migration_name(name);
        return parsed ? parsed->sequence : 0;
    }
}

MigrationFile MigrationFile::from(std::string name, std::string sql) {
    MigrationFile f;
    auto parsed = parse_migration_name(name);
    f.sequence = parsed ? parsed->sequence : 0;
    f.name = std::move(name);
    f.sql = std::move(sql);
    return f;
}

std::optional<MigrationName> parse_migration_name(const std::string& filename) {
    static const std::regex pattern(R"(^(\d+)_(.+)\.([A-Za-z0-9]+)$)");
    std::smatch m;
    if (!std::regex_match(filename, m, pattern)) return std::nullopt;
    return MigrationName{std::stoll(m[1].str()), m[2].str()};
}

std::string format_migration_name(int64_t sequence, const std::string& description, const std::string& ext) {
    return std::format("{:04}_{}.{}", sequence, description, ext);
}

std::string compute_checksum(const std::string& sql) {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) TABULA_THROW("EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), sql.data(), sql.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        TABULA_THROW("SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    return out;
}

/* ---------- MigrationRunner ---------- */

std::string MigrationRunner::history_table_sql() const {
    std::ostringstream ddl;
    ddl << "CREATE TABLE IF NOT EXISTS " << HISTORY << " (";
    if (executor_.dialect().kind() == Dialect::SQLite) {
        ddl << "\"id\" INTEGER PRIMARY KEY AUTOINCREMENT, "
            << "\"name\" TEXT NOT NULL UNIQUE, "
            << "\"checksum\" TEXT NOT NULL, "
            << "\"applied_at\" TEXT NOT NULL DEFAULT " << executor_.dialect().now_default();
    } else {
        ddl << "\"id\" serial PRIMARY KEY, "
            << "\"name\" text NOT NULL UNIQUE, "
            << "\"checksum\" text NOT NULL, "
            << "\"applied_at\" timestamp with time zone NOT NULL DEFAULT " << executor_.dialect().now_default();
    }
    ddl << ")";
    return ddl.str();
}

void MigrationRunner::create_history_table() const {
    const std::string sql = history_table_sql();
    try {
        executor_.execute(sql);
    } catch (const DbError& e) {
        throw MigrationError("Failed to create migration history table", sql, e.what());
    }
}

ApplyResult MigrationRunner::apply(const std::string& sql, const std::string& name, const ApplyOptions& options) const {
    const SqlDialect& d = executor_.dialect();

    ApplyResult result;
    result.name = name;
    result.checksum = compute_checksum(sql);
    result.dry_run = options.dry_run;
    result.statements.push_back(SqlQuery{sql, {}});
    result.statements.push_back(SqlQuery{
        "INSERT INTO " + HISTORY + " (\"name\", \"checksum\") VALUES (" + d.param(1) + ", " + d.param(2) + ")",
        {name, result.checksum}});

    if (options.dry_run) return result;

    for (const auto& stmt : result.statements) {
        try {
            executor_.execute(stmt);
        } catch (const DbError& e) {
            std::cerr << "[migrate] " << name << " failed: " << e.what() << std::endl;
            throw MigrationError("Failed to apply migration: " + name, stmt.sql, e.what());
        }
    }
    std::cout << "[migrate] applied " << name << " (" << result.checksum.substr(0, 12) << ")" << std::endl;
    return result;
}

std::vector<AppliedMigration> MigrationRunner::get_applied() const {
    const std::string sql = "SELECT \"name\", \"checksum\", \"applied_at\" FROM " + HISTORY + " ORDER BY \"id\" ASC";
    QueryResult res;
    try {
        res = executor_.execute(sql);
    } catch (const DbError& e) {
        throw MigrationError("Failed to list applied migrations", sql, e.what());
    }

    std::vector<AppliedMigration> out;
    for (const auto& row : res.rows.GetArray()) {
        AppliedMigration m;
        m.name = jhlp::get<std::string>(row, "name");
        m.checksum = jhlp::get<std::string>(row, "checksum");
        if (row.HasMember("applied_at")) m.applied_at = jhlp::dump(row["applied_at"]);
        else if (row.HasMember("appliedAt")) m.applied_at = jhlp::dump(row["appliedAt"]);
        out.push_back(std::move(m));
    }
    return out;
}

/* ---------- pure checks ---------- */

std::vector<MigrationFile> get_pending(const std::vector<MigrationFile>& files,
                                       const std::vector<AppliedMigration>& applied) {
    std::set<std::string> done;
    for (const auto& a : applied) done.insert(a.name);

    std::vector<MigrationFile> out;
    for (const auto& f : files) if (!done.count(f.name)) out.push_back(f);
    std::stable_sort(out.begin(), out.end(),
                     [](const MigrationFile& a, const MigrationFile& b) { return a.sequence < b.sequence; });
    return out;
}

std::vector<std::string> detect_drift(const std::vector<MigrationFile>& files,
                                      const std::vector<AppliedMigration>& applied) {
    std::vector<std::string> out;
    for (const auto& f : files) {
        auto it = std::find_if(applied.begin(), applied.end(),
                               [&](const AppliedMigration& a) { return a.name == f.name; });
        if (it == applied.end()) continue;
        if (compute_checksum(f.sql) != it->checksum) out.push_back(f.name);
    }
    return out;
}

std::vector<std::string> detect_out_of_order(const std::vector<MigrationFile>& files,
                                             const std::vector<AppliedMigration>& applied) {
    std::vector<std::string> out;
    if (applied.empty()) return out;

    const int64_t last = sequence_of(applied.back().name, files);
    for (const auto& f : get_pending(files, applied)) {
        if (f.sequence < last) out.push_back(f.name);
    }
    return out;
}

} // namespace tabula
