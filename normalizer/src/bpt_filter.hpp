#pragma once

#include "fixed_point.hpp"
#include <string>
#include <vector>

// The "WithoutBpt" views of a pool: every per-token column minus the pool's own token.
struct BptExclusion {
    std::vector<FixedPoint> scaling_factors;
    std::vector<std::string> parsed_tokens;
    std::vector<FixedPoint> balances_evm;
    std::vector<FixedPoint> price_rates;
    std::vector<FixedPoint> upscaled_balances;
};

class BptFilter {
public:
    static constexpr int NOT_FOUND = -1;
    
    // Exact, case-sensitive match of the pool address against the token list.
    static int find_bpt_index(const std::string& pool_address,
                              const std::vector<std::string>& parsed_tokens);
    
    // Drops position `bpt_index` from each column. With NOT_FOUND every
    // output is empty, not a copy of the input. Columns of unequal length or
    // an index past the end throw ArrayLengthMismatch.
    static BptExclusion exclude(int bpt_index,
                                const std::vector<FixedPoint>& scaling_factors,
                                const std::vector<std::string>& parsed_tokens,
                                const std::vector<FixedPoint>& balances_evm,
                                const std::vector<FixedPoint>& price_rates,
                                const std::vector<FixedPoint>& upscaled_balances);
    
    template <typename T>
    static std::vector<T> without_index(const std::vector<T>& column, size_t index) {
        std::vector<T> result;
        result.reserve(column.empty() ? 0 : column.size() - 1);
        for (size_t i = 0; i < column.size(); ++i) {
            if (i != index) result.push_back(column[i]);
        }
        return result;
    }
};
