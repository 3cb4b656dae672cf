#include "field_defaults.hpp"
#include <algorithm>

const std::vector<FieldDefault>& FieldDefaults::table() {
    static const std::vector<FieldDefault> defaults = {
        // per token
        {"weight", "1", DefaultTrigger::MISSING},
        {"priceRate", "1", DefaultTrigger::MISSING},
        {"oldPriceRate", "1", DefaultTrigger::MISSING},
        
        // per pool
        {"amp", "1", DefaultTrigger::MISSING},
        {"protocolSwapFeeCache", "0", DefaultTrigger::MISSING_OR_EMPTY},
        {"protocolYieldFeeCache", "0", DefaultTrigger::MISSING_OR_EMPTY},
        {"totalShares", "0", DefaultTrigger::MISSING_OR_EMPTY},
        {"lastJoinExitInvariant", "0", DefaultTrigger::MISSING_OR_EMPTY},
        {"athRateProduct", "0", DefaultTrigger::MISSING_OR_EMPTY}
    };
    return defaults;
}

std::optional<FieldDefault> FieldDefaults::lookup(const std::string& field) {
    const auto& defaults = table();
    auto it = std::find_if(defaults.begin(), defaults.end(),
                           [&field](const FieldDefault& d) { return d.field == field; });
    if (it == defaults.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<std::string> FieldDefaults::resolve(const std::string& field,
                                                  const std::optional<std::string>& raw) {
    auto entry = lookup(field);
    if (!entry) {
        return raw;
    }
    
    if (!raw.has_value()) {
        return entry->value;
    }
    if (entry->trigger == DefaultTrigger::MISSING_OR_EMPTY && raw->empty()) {
        return entry->value;
    }
    return raw;
}
