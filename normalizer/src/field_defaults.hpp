#pragma once

#include <optional>
#include <string>
#include <vector>

enum class DefaultTrigger {
    MISSING,          // only when the field is absent
    MISSING_OR_EMPTY  // absent or ""
};

struct FieldDefault {
    std::string field;
    std::string value;
    DefaultTrigger trigger;
};

// Every default applied while normalizing a raw pool lives here.
// Fields without an entry (swapFee, balance) are required.
class FieldDefaults {
public:
    static constexpr int TOKEN_DECIMALS = 18;
    static constexpr bool EXEMPT_FROM_YIELD_PROTOCOL_FEE = false;
    
    static const std::vector<FieldDefault>& table();
    static std::optional<FieldDefault> lookup(const std::string& field);
    
    // Returns the raw value, the default if the entry's trigger fires,
    // or nullopt for an absent field that has no default.
    static std::optional<std::string> resolve(const std::string& field,
                                              const std::optional<std::string>& raw);
};
