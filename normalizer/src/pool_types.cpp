#include "pool_types.hpp"
#include "errors.hpp"
#include <limits>

namespace {

const std::string UNKNOWN_POOL = "<unknown>";

std::optional<std::string> optional_decimal(const nlohmann::json& j, const std::string& key,
                                            const std::string& field, const std::string& pool) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw FieldParseError(field, pool, "expected a decimal string, got " +
                              std::string(it->type_name()));
    }
    return it->get<std::string>();
}

std::string required_address(const nlohmann::json& j, const std::string& field,
                             const std::string& pool) {
    auto it = j.find("address");
    if (it == j.end() || it->is_null()) {
        throw FieldParseError(field, pool, "missing");
    }
    if (!it->is_string()) {
        throw FieldParseError(field, pool, "expected a string");
    }
    return it->get<std::string>();
}

RawToken parse_token(const nlohmann::json& j, size_t index, const std::string& pool) {
    std::string prefix = "tokens[" + std::to_string(index) + "].";
    if (!j.is_object()) {
        throw FieldParseError("tokens[" + std::to_string(index) + "]", pool, "expected an object");
    }
    
    RawToken token;
    token.address = required_address(j, prefix + "address", pool);
    token.balance = optional_decimal(j, "balance", prefix + "balance", pool);
    token.weight = optional_decimal(j, "weight", prefix + "weight", pool);
    token.price_rate = optional_decimal(j, "priceRate", prefix + "priceRate", pool);
    token.old_price_rate = optional_decimal(j, "oldPriceRate", prefix + "oldPriceRate", pool);
    
    auto decimals = j.find("decimals");
    if (decimals != j.end() && !decimals->is_null()) {
        if (!decimals->is_number_integer()) {
            throw FieldParseError(prefix + "decimals", pool, "expected an integer");
        }
        auto value = decimals->get<int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw FieldParseError(prefix + "decimals", pool, "out of range");
        }
        token.decimals = static_cast<int>(value);
    }
    
    auto exempt = j.find("isExemptFromYieldProtocolFee");
    if (exempt != j.end() && !exempt->is_null()) {
        if (!exempt->is_boolean()) {
            throw FieldParseError(prefix + "isExemptFromYieldProtocolFee", pool,
                                  "expected a boolean");
        }
        token.is_exempt_from_yield_protocol_fee = exempt->get<bool>();
    }
    
    return token;
}

nlohmann::json to_strings(const std::vector<FixedPoint>& values) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : values) {
        arr.push_back(fixed_point::to_string(v));
    }
    return arr;
}

} // namespace

void from_json(const nlohmann::json& j, RawPool& pool) {
    if (!j.is_object()) {
        throw FieldParseError("pool", UNKNOWN_POOL, "expected an object");
    }
    
    pool.address = required_address(j, "address", UNKNOWN_POOL);
    const std::string& addr = pool.address;
    
    auto id = j.find("id");
    pool.id = (id != j.end() && id->is_string()) ? id->get<std::string>() : "";
    
    auto tokens = j.find("tokens");
    if (tokens == j.end() || !tokens->is_array()) {
        throw FieldParseError("tokens", addr, "expected an array");
    }
    pool.tokens.clear();
    for (size_t i = 0; i < tokens->size(); ++i) {
        pool.tokens.push_back(parse_token((*tokens)[i], i, addr));
    }
    
    pool.amp = optional_decimal(j, "amp", "amp", addr);
    pool.swap_fee = optional_decimal(j, "swapFee", "swapFee", addr);
    pool.protocol_swap_fee_cache =
        optional_decimal(j, "protocolSwapFeeCache", "protocolSwapFeeCache", addr);
    pool.protocol_yield_fee_cache =
        optional_decimal(j, "protocolYieldFeeCache", "protocolYieldFeeCache", addr);
    pool.total_shares = optional_decimal(j, "totalShares", "totalShares", addr);
    pool.last_join_exit_invariant =
        optional_decimal(j, "lastJoinExitInvariant", "lastJoinExitInvariant", addr);
    pool.ath_rate_product = optional_decimal(j, "athRateProduct", "athRateProduct", addr);
}

void to_json(nlohmann::json& j, const NormalizedPoolInfo& info) {
    j = nlohmann::json{
        {"parsedTokens", info.parsed_tokens},
        {"exemptedTokens", info.exempted_tokens},
        {"balancesEvm", to_strings(info.balances_evm)},
        {"weights", to_strings(info.weights)},
        {"priceRates", to_strings(info.price_rates)},
        {"oldPriceRates", to_strings(info.old_price_rates)},
        {"scalingFactors", to_strings(info.scaling_factors)},
        {"upScaledBalances", to_strings(info.upscaled_balances)},
        {"bptIndex", info.bpt_index},
        {"parsedTokensWithoutBpt", info.parsed_tokens_without_bpt},
        {"balancesEvmWithoutBpt", to_strings(info.balances_evm_without_bpt)},
        {"priceRatesWithoutBpt", to_strings(info.price_rates_without_bpt)},
        {"scalingFactorsWithoutBpt", to_strings(info.scaling_factors_without_bpt)},
        {"upScaledBalancesWithoutBpt", to_strings(info.upscaled_balances_without_bpt)},
        {"higherBalanceTokenIndex", info.higher_balance_token_index},
        {"ampWithPrecision", fixed_point::to_string(info.amp_with_precision)},
        {"swapFeeEvm", fixed_point::to_string(info.swap_fee_evm)},
        {"totalSharesEvm", fixed_point::to_string(info.total_shares_evm)},
        {"protocolSwapFeePct", info.protocol_swap_fee_pct},
        {"protocolYieldFeePct", info.protocol_yield_fee_pct},
        {"lastJoinExitInvariant", info.last_join_exit_invariant},
        {"athRateProduct", info.ath_rate_product}
    };
}
