#include "bpt_filter.hpp"
#include "errors.hpp"
#include <algorithm>

int BptFilter::find_bpt_index(const std::string& pool_address,
                              const std::vector<std::string>& parsed_tokens) {
    auto it = std::find(parsed_tokens.begin(), parsed_tokens.end(), pool_address);
    if (it == parsed_tokens.end()) {
        return NOT_FOUND;
    }
    return static_cast<int>(std::distance(parsed_tokens.begin(), it));
}

BptExclusion BptFilter::exclude(int bpt_index,
                                const std::vector<FixedPoint>& scaling_factors,
                                const std::vector<std::string>& parsed_tokens,
                                const std::vector<FixedPoint>& balances_evm,
                                const std::vector<FixedPoint>& price_rates,
                                const std::vector<FixedPoint>& upscaled_balances) {
    const size_t n = parsed_tokens.size();
    for (size_t size : {scaling_factors.size(), balances_evm.size(),
                        price_rates.size(), upscaled_balances.size()}) {
        if (size != n) {
            throw ArrayLengthMismatch(n, size);
        }
    }
    
    BptExclusion result;
    if (bpt_index == NOT_FOUND) {
        return result;
    }
    if (bpt_index < 0 || static_cast<size_t>(bpt_index) >= n) {
        throw ArrayLengthMismatch(n, static_cast<size_t>(bpt_index));
    }
    
    const auto index = static_cast<size_t>(bpt_index);
    result.scaling_factors = without_index(scaling_factors, index);
    result.parsed_tokens = without_index(parsed_tokens, index);
    result.balances_evm = without_index(balances_evm, index);
    result.price_rates = without_index(price_rates, index);
    result.upscaled_balances = without_index(upscaled_balances, index);
    return result;
}
