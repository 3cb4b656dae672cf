#include "canonical_order.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <numeric>

const std::string NATIVE_ASSET_ADDRESS = "0x0000000000000000000000000000000000000000";

namespace {

template <typename T>
void check_length(const std::vector<T>& column, size_t expected) {
    if (column.size() != expected) {
        throw ArrayLengthMismatch(expected, column.size());
    }
}

} // namespace

CanonicalReorderer::CanonicalReorderer(const std::string& wrapped_native_asset)
    : wrapped_native_asset_(wrapped_native_asset) {}

bool CanonicalReorderer::is_same_address(const std::string& a, const std::string& b) {
    return util::to_lower(a) == util::to_lower(b);
}

bool CanonicalReorderer::is_native(const std::string& token) {
    return is_same_address(token, NATIVE_ASSET_ADDRESS);
}

std::string CanonicalReorderer::unwrap(const std::string& token,
                                       const std::string& wrapped_native_asset) {
    return token == wrapped_native_asset ? NATIVE_ASSET_ADDRESS : token;
}

std::string CanonicalReorderer::translate_to_erc20(const std::string& token) const {
    return is_native(token) ? wrapped_native_asset_ : token;
}

std::vector<size_t> CanonicalReorderer::sort_order(const std::vector<std::string>& tokens) const {
    std::vector<std::string> keys;
    keys.reserve(tokens.size());
    for (const auto& token : tokens) {
        keys.push_back(util::to_lower(translate_to_erc20(token)));
    }
    
    std::vector<size_t> order(tokens.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });
    return order;
}

TokenColumns CanonicalReorderer::sort_tokens(const TokenColumns& columns) const {
    const size_t n = columns.tokens.size();
    check_length(columns.decimals, n);
    check_length(columns.scaling_factors, n);
    check_length(columns.balances_evm, n);
    check_length(columns.upscaled_balances, n);
    check_length(columns.weights, n);
    check_length(columns.price_rates, n);
    check_length(columns.old_price_rates, n);
    check_length(columns.exempted_tokens, n);
    
    const auto order = sort_order(columns.tokens);
    
    TokenColumns sorted;
    sorted.tokens = permute(columns.tokens, order);
    sorted.decimals = permute(columns.decimals, order);
    sorted.scaling_factors = permute(columns.scaling_factors, order);
    sorted.balances_evm = permute(columns.balances_evm, order);
    sorted.upscaled_balances = permute(columns.upscaled_balances, order);
    sorted.weights = permute(columns.weights, order);
    sorted.price_rates = permute(columns.price_rates, order);
    sorted.old_price_rates = permute(columns.old_price_rates, order);
    sorted.exempted_tokens = permute(columns.exempted_tokens, order);
    return sorted;
}
