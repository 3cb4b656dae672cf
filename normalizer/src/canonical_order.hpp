#pragma once

#include "fixed_point.hpp"
#include <string>
#include <vector>

extern const std::string NATIVE_ASSET_ADDRESS; // 0x000...000

// Parallel per-token columns handed to the reorderer. Scaling factors cross
// this boundary as exact base-10 integer strings.
struct TokenColumns {
    std::vector<std::string> tokens;
    std::vector<int> decimals;
    std::vector<std::string> scaling_factors;
    std::vector<FixedPoint> balances_evm;
    std::vector<FixedPoint> upscaled_balances;
    std::vector<FixedPoint> weights;
    std::vector<FixedPoint> price_rates;
    std::vector<FixedPoint> old_price_rates;
    std::vector<bool> exempted_tokens;
};

// Sorts a pool's token columns into canonical (address) order. The native
// asset sorts in the position of its wrapped token.
class CanonicalReorderer {
public:
    explicit CanonicalReorderer(const std::string& wrapped_native_asset);
    
    static bool is_same_address(const std::string& a, const std::string& b);
    static bool is_native(const std::string& token);
    
    // Exact match against `wrapped_native_asset` becomes the native sentinel.
    static std::string unwrap(const std::string& token, const std::string& wrapped_native_asset);
    
    std::string translate_to_erc20(const std::string& token) const;
    
    // Stable permutation: position k of the result is the input index that lands at k.
    std::vector<size_t> sort_order(const std::vector<std::string>& tokens) const;
    
    // Applies sort_order(columns.tokens) to every column.
    // Throws ArrayLengthMismatch when a column disagrees with the token column.
    TokenColumns sort_tokens(const TokenColumns& columns) const;
    
    template <typename T>
    static std::vector<T> permute(const std::vector<T>& column, const std::vector<size_t>& order) {
        std::vector<T> result;
        result.reserve(column.size());
        for (size_t index : order) {
            result.push_back(column.at(index));
        }
        return result;
    }
    
private:
    std::string wrapped_native_asset_;
};
