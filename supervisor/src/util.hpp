#pragma once

#include <string>

namespace util {
    std::string current_utc_timestamp();
    std::string redact_dsn(const std::string& dsn);
    std::string with_connect_timeout(const std::string& dsn, int timeout_s);
}
