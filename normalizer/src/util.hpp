#pragma once

#include <string>

namespace util {
    std::string to_lower(const std::string& str);
    bool is_valid_evm_address(const std::string& address);
    bool parse_bool(const std::string& str, bool default_val);
}
