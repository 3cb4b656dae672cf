#pragma once

#include "fixed_point.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// One token of a pool as delivered by the indexer, amounts in human units.
struct RawToken {
    std::string address;
    std::optional<std::string> balance; // required
    std::optional<int> decimals;
    std::optional<std::string> weight;
    std::optional<std::string> price_rate;
    std::optional<std::string> old_price_rate;
    std::optional<bool> is_exempt_from_yield_protocol_fee;
};

struct RawPool {
    std::string id;
    std::string address; // the pool's own token when it issues one
    std::vector<RawToken> tokens;
    std::optional<std::string> amp;
    std::optional<std::string> swap_fee; // required
    std::optional<std::string> protocol_swap_fee_cache;
    std::optional<std::string> protocol_yield_fee_cache;
    std::optional<std::string> total_shares;
    std::optional<std::string> last_join_exit_invariant;
    std::optional<std::string> ath_rate_product;
};

// Per-token arrays share one order: the input order, or the canonical
// order when a wrapped native asset was supplied.
struct NormalizedPoolInfo {
    std::vector<std::string> parsed_tokens;
    std::vector<bool> exempted_tokens;
    std::vector<FixedPoint> balances_evm;
    std::vector<FixedPoint> weights;
    std::vector<FixedPoint> price_rates;
    std::vector<FixedPoint> old_price_rates;
    std::vector<FixedPoint> scaling_factors;
    std::vector<FixedPoint> upscaled_balances;
    
    int bpt_index = -1;
    std::vector<std::string> parsed_tokens_without_bpt;
    std::vector<FixedPoint> balances_evm_without_bpt;
    std::vector<FixedPoint> price_rates_without_bpt;
    std::vector<FixedPoint> scaling_factors_without_bpt;
    std::vector<FixedPoint> upscaled_balances_without_bpt;
    
    int higher_balance_token_index = -1;
    FixedPoint amp_with_precision;
    FixedPoint swap_fee_evm;
    FixedPoint total_shares_evm;
    
    // human-unit decimal strings
    std::string protocol_swap_fee_pct;
    std::string protocol_yield_fee_pct;
    std::string last_join_exit_invariant;
    std::string ath_rate_product;
};

// Indexer JSON -> RawPool. Throws FieldParseError on a missing or mistyped field.
void from_json(const nlohmann::json& j, RawPool& pool);

// Fixed-point integers are written as base-10 strings.
void to_json(nlohmann::json& j, const NormalizedPoolInfo& info);
