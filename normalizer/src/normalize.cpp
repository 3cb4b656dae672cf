#include "normalize.hpp"
#include "bpt_filter.hpp"
#include "canonical_order.hpp"
#include "errors.hpp"
#include "field_defaults.hpp"
#include "scaling.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

struct ParsedToken {
    std::string address;
    int decimals;
    FixedPoint balance_evm;
    FixedPoint weight;
    FixedPoint price_rate;
    FixedPoint old_price_rate;
    FixedPoint scaling_factor;
    bool exempt;
};

std::string resolve_field(const std::string& name, const std::string& field,
                          const std::optional<std::string>& raw, const std::string& pool) {
    auto value = FieldDefaults::resolve(name, raw);
    if (!value) {
        throw FieldParseError(field, pool, "required field is missing");
    }
    return *value;
}

FixedPoint parse_amount(const std::string& field, const std::string& text, int decimals,
                        const std::string& pool) {
    FixedPoint value;
    try {
        value = fixed_point::parse_fixed(text, decimals);
    } catch (const std::invalid_argument& e) {
        throw FieldParseError(field, pool, e.what());
    } catch (const std::overflow_error&) {
        throw FieldParseError(field, pool, "\"" + text + "\" exceeds 256 bits");
    }
    
    if (value < 0) {
        throw FieldParseError(field, pool, "negative amount \"" + text + "\"");
    }
    return value;
}

FixedPoint parse_pool_field(const std::string& name, const std::optional<std::string>& raw,
                            int decimals, const std::string& pool) {
    return parse_amount(name, resolve_field(name, name, raw, pool), decimals, pool);
}

ParsedToken parse_token(const RawToken& raw, size_t index, const NormalizeOptions& options,
                        const std::string& pool) {
    const std::string prefix = "tokens[" + std::to_string(index) + "].";
    auto resolved = [&](const std::string& name, const std::optional<std::string>& value) {
        return resolve_field(name, prefix + name, value, pool);
    };
    
    ParsedToken token;
    token.exempt = raw.is_exempt_from_yield_protocol_fee.value_or(
        FieldDefaults::EXEMPT_FROM_YIELD_PROTOCOL_FEE);
    
    token.address = raw.address;
    if (options.unwrap_native_asset && options.wrapped_native_asset) {
        token.address = CanonicalReorderer::unwrap(raw.address, *options.wrapped_native_asset);
    }
    
    token.decimals = raw.decimals.value_or(FieldDefaults::TOKEN_DECIMALS);
    ScalingFactorComputer::check_decimals(token.decimals);
    
    token.balance_evm = parse_amount(prefix + "balance", resolved("balance", raw.balance),
                                     token.decimals, pool);
    token.weight = parse_amount(prefix + "weight", resolved("weight", raw.weight),
                                fixed_point::DEFAULT_DECIMALS, pool);
    token.price_rate = parse_amount(prefix + "priceRate", resolved("priceRate", raw.price_rate),
                                    fixed_point::DEFAULT_DECIMALS, pool);
    token.old_price_rate = parse_amount(prefix + "oldPriceRate",
                                        resolved("oldPriceRate", raw.old_price_rate),
                                        fixed_point::DEFAULT_DECIMALS, pool);
    
    try {
        token.scaling_factor = ScalingFactorComputer::scaling_factor(token.decimals, token.price_rate);
    } catch (const std::overflow_error&) {
        throw FieldParseError(prefix + "priceRate", pool, "scaling factor exceeds 256 bits");
    }
    
    return token;
}

// Array-of-structs -> struct-of-arrays, the shape the reorderer and filter work on.
TokenColumns project_columns(const std::vector<ParsedToken>& parsed,
                             const std::vector<FixedPoint>& upscaled_balances) {
    TokenColumns columns;
    for (const auto& token : parsed) {
        columns.tokens.push_back(token.address);
        columns.decimals.push_back(token.decimals);
        columns.scaling_factors.push_back(fixed_point::to_string(token.scaling_factor));
        columns.balances_evm.push_back(token.balance_evm);
        columns.weights.push_back(token.weight);
        columns.price_rates.push_back(token.price_rate);
        columns.old_price_rates.push_back(token.old_price_rate);
        columns.exempted_tokens.push_back(token.exempt);
    }
    columns.upscaled_balances = upscaled_balances;
    return columns;
}

} // namespace

NormalizedPoolInfo PoolNormalizer::normalize_pool(const RawPool& pool,
                                                  const NormalizeOptions& options) {
    const std::string& addr = pool.address;
    spdlog::debug("Normalizing pool {} ({} tokens)", addr, pool.tokens.size());
    
    std::vector<ParsedToken> parsed;
    parsed.reserve(pool.tokens.size());
    for (size_t i = 0; i < pool.tokens.size(); ++i) {
        parsed.push_back(parse_token(pool.tokens[i], i, options, addr));
    }
    
    std::vector<FixedPoint> balances;
    std::vector<FixedPoint> scaling_factors;
    for (const auto& token : parsed) {
        balances.push_back(token.balance_evm);
        scaling_factors.push_back(token.scaling_factor);
    }
    
    std::vector<FixedPoint> upscaled;
    try {
        upscaled = Upscaler::upscale(balances, scaling_factors);
    } catch (const std::overflow_error&) {
        throw FieldParseError("balance", addr, "upscaled balance exceeds 256 bits");
    }
    
    TokenColumns columns = project_columns(parsed, upscaled);
    
    const bool reorder = options.wrapped_native_asset && !options.wrapped_native_asset->empty();
    if (reorder) {
        CanonicalReorderer reorderer(*options.wrapped_native_asset);
        columns = reorderer.sort_tokens(columns);
        spdlog::debug("Pool {} tokens reordered canonically", addr);
    }
    
    NormalizedPoolInfo info;
    info.parsed_tokens = columns.tokens;
    info.exempted_tokens = columns.exempted_tokens;
    info.balances_evm = columns.balances_evm;
    info.weights = columns.weights;
    info.price_rates = columns.price_rates;
    info.old_price_rates = columns.old_price_rates;
    info.upscaled_balances = columns.upscaled_balances;
    for (const auto& sf : columns.scaling_factors) {
        info.scaling_factors.push_back(fixed_point::from_string(sf));
    }
    
    info.amp_with_precision = parse_pool_field("amp", pool.amp, fixed_point::AMP_PRECISION, addr);
    info.swap_fee_evm = parse_pool_field("swapFee", pool.swap_fee,
                                         fixed_point::DEFAULT_DECIMALS, addr);
    
    info.higher_balance_token_index = fixed_point::index_of_max(info.upscaled_balances);
    
    info.protocol_swap_fee_pct = fixed_point::format_fixed(
        parse_pool_field("protocolSwapFeeCache", pool.protocol_swap_fee_cache,
                         fixed_point::DEFAULT_DECIMALS, addr),
        fixed_point::DEFAULT_DECIMALS);
    info.protocol_yield_fee_pct = fixed_point::format_fixed(
        parse_pool_field("protocolYieldFeeCache", pool.protocol_yield_fee_cache,
                         fixed_point::DEFAULT_DECIMALS, addr),
        fixed_point::DEFAULT_DECIMALS);
    
    info.bpt_index = BptFilter::find_bpt_index(addr, info.parsed_tokens);
    auto without_bpt = BptFilter::exclude(info.bpt_index, info.scaling_factors,
                                          info.parsed_tokens, info.balances_evm,
                                          info.price_rates, info.upscaled_balances);
    info.scaling_factors_without_bpt = std::move(without_bpt.scaling_factors);
    info.parsed_tokens_without_bpt = std::move(without_bpt.parsed_tokens);
    info.balances_evm_without_bpt = std::move(without_bpt.balances_evm);
    info.price_rates_without_bpt = std::move(without_bpt.price_rates);
    info.upscaled_balances_without_bpt = std::move(without_bpt.upscaled_balances);
    if (info.bpt_index != BptFilter::NOT_FOUND) {
        spdlog::debug("Pool {} holds its own token at index {}", addr, info.bpt_index);
    }
    
    info.total_shares_evm = parse_pool_field("totalShares", pool.total_shares,
                                             fixed_point::DEFAULT_DECIMALS, addr);
    info.last_join_exit_invariant = resolve_field("lastJoinExitInvariant", "lastJoinExitInvariant",
                                                  pool.last_join_exit_invariant, addr);
    info.ath_rate_product = fixed_point::format_fixed(
        parse_pool_field("athRateProduct", pool.ath_rate_product,
                         fixed_point::DEFAULT_DECIMALS, addr),
        fixed_point::DEFAULT_DECIMALS);
    
    spdlog::debug("Normalized pool {}: bpt_index={}, higher_balance_token_index={}",
                  addr, info.bpt_index, info.higher_balance_token_index);
    return info;
}

DocumentResult PoolNormalizer::normalize_document(const nlohmann::json& document,
                                                  const NormalizeOptions& options) {
    const nlohmann::json entries = document.is_array() ? document
                                                       : nlohmann::json::array({document});
    
    DocumentResult result;
    for (const auto& entry : entries) {
        try {
            auto raw = entry.get<RawPool>();
            nlohmann::json normalized = normalize_pool(raw, options);
            result.pools.push_back(std::move(normalized));
        } catch (const PoolNormalizeError& e) {
            std::string id = "<no id>";
            if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
                id = entry["id"].get<std::string>();
            }
            spdlog::error("Skipping pool {}: {}", id, e.what());
            result.skipped++;
        }
    }
    return result;
}
