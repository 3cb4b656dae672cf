#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace util {

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_valid_evm_address(const std::string& address) {
    // 0x + 20 bytes hex
    if (address.size() != 42) return false;
    if (address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) return false;
    
    return std::all_of(address.begin() + 2, address.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool parse_bool(const std::string& str, bool default_val) {
    std::string value = to_lower(str);
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    return default_val;
}

} // namespace util
