#include <iostream>
#include "tabula/ddl_visitor.hpp"
#include "tabula/differ.hpp"
#include "tabula/errors.hpp"
#include "tabula/snapshot.hpp"

static bool load_snapshot_from_file(const std::string& path, tabula::SchemaSnapshot& snapshot)
{
    jdoc doc;
    if (!jhlp::parse_file(path, doc))
        return false;
    return tabula::SchemaSnapshot::from_json(doc, snapshot);
}

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <before.json> <after.json> [postgres|sqlite]" << std::endl;
        return 2;
    }

    tabula::SchemaSnapshot before, after;
    if (!load_snapshot_from_file(argv[1], before))
    {
        std::cerr << "Failed to load snapshot " << argv[1] << std::endl;
        return 1;
    }
    if (!load_snapshot_from_file(argv[2], after))
    {
        std::cerr << "Failed to load snapshot " << argv[2] << std::endl;
        return 1;
    }

    try
    {
        const tabula::SqlDialect& dialect =
            tabula::dialect_for(tabula::parse_dialect(argc > 3 ? argv[3] : "postgres"));

        auto changes = tabula::compute_diff(before, after);
        std::cout << "[*] Changes (" << changes.size() << "):" << std::endl;
        for (const auto& change : changes)
        {
            std::cout << "  " << tabula::change_type(change)
                      << (tabula::is_destructive(change) ? "  (destructive)" : "") << std::endl;
        }

        std::cout << "\n[*] Migration (" << dialect.name() << "):" << std::endl;
        std::cout << tabula::generate_migration_sql(changes, after, dialect) << std::endl;

        std::cout << "\n[*] Rollback:" << std::endl;
        std::cout << tabula::generate_rollback_sql(changes, before, dialect) << std::endl;
    }
    catch (const tabula::DbError& e)
    {
        std::cerr << e.name() << ": " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
