#include "postgres_checker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

PostgresChecker::PostgresChecker(const std::string& dsn, int connect_timeout_s)
    : dsn_(util::with_connect_timeout(dsn, connect_timeout_s)) {
    if (dsn.empty()) {
        throw std::runtime_error("DATABASE_URL is not set");
    }
}

pqxx::connection PostgresChecker::make_connection() {
    return pqxx::connection(dsn_);
}

bool PostgresChecker::test_connection() {
    auto conn = make_connection();
    pqxx::work txn(conn);
    txn.exec("SELECT 1");
    txn.commit();
    spdlog::debug("Postgres ping ok: {}", util::redact_dsn(dsn_));
    return true;
}
