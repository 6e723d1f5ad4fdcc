#pragma once
#include <functional>
#include <memory>
#include <string>
#include "tabula/dialect.hpp"
#include "tabula/executor.hpp"
#include "tabula/value.hpp"

namespace tabula {

/**
 * One live backend connection. query() is the QueryFn the engine runs on;
 * driver failures leave it as BackendError and are classified by the Executor.
 *
 * - Statements without parameters may hold several SQL statements (migration bodies).
 * - Result rows come back in statement column order; row_count is the number of
 *   rows returned, or the rows affected for plain DML.
 */
class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename or :memory:; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    virtual QueryResult query(const std::string& sql, const Params& params = {}) = 0;

    virtual const SqlDialect& dialect() const = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    /**
     * @brief Runs @p body between BEGIN and COMMIT.
     *
     * 1. begin()
     * 2. body()
     * 3. commit() on success; rollback() and rethrow on any exception
     */
    void transaction(const std::function<void()>& body);

    QueryFn query_fn() {
        return [this](const std::string& sql, const Params& params) { return query(sql, params); };
    }

    Executor executor() { return Executor(query_fn(), dialect()); }

protected:
    bool tr_started_ = false;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif

} // namespace tabula
