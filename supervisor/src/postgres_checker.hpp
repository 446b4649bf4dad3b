#pragma once

#include "db_probe.hpp"
#include <pqxx/pqxx>
#include <string>

class PostgresChecker : public ConnectionChecker {
public:
    // connect_timeout_s is appended to the DSN unless it already carries one.
    PostgresChecker(const std::string& dsn, int connect_timeout_s);
    
    bool test_connection() override;
    
private:
    std::string dsn_;
    
    pqxx::connection make_connection();
};
