#include "tabula/sqlconnection.hpp"
#include <iostream>
#include "tabula/lib.hpp"

namespace tabula {

void SQLConnection::transaction(const std::function<void()>& body) {
    if (!begin()) TABULA_THROW("could not start a transaction on %s", dialect().name().c_str());
    try {
        body();
    } catch (...) {
        try {
            rollback();
        } catch (const std::exception& e) {
            std::cerr << "[" << dialect().name() << "] rollback failed: " << e.what() << std::endl;
        }
        throw;
    }
    if (!commit()) TABULA_THROW("commit failed on %s", dialect().name().c_str());
}

} // namespace tabula
