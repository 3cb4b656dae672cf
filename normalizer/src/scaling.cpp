#include "scaling.hpp"
#include "errors.hpp"

void ScalingFactorComputer::check_decimals(int decimals) {
    if (decimals < 0 || decimals > MAX_TOKEN_DECIMALS) {
        throw InvalidTokenDecimals(decimals);
    }
}

FixedPoint ScalingFactorComputer::base_factor(int decimals) {
    check_decimals(decimals);
    return fixed_point::one() * fixed_point::pow10(MAX_TOKEN_DECIMALS - decimals);
}

FixedPoint ScalingFactorComputer::scaling_factor(int decimals,
                                                 const std::optional<FixedPoint>& price_rate) {
    FixedPoint base = base_factor(decimals);
    if (!price_rate) {
        return base;
    }
    return fixed_point::mul_down_fixed(base, *price_rate);
}

std::vector<FixedPoint> Upscaler::upscale(const std::vector<FixedPoint>& balances,
                                          const std::vector<FixedPoint>& scaling_factors) {
    if (balances.size() != scaling_factors.size()) {
        throw ArrayLengthMismatch(balances.size(), scaling_factors.size());
    }
    
    std::vector<FixedPoint> upscaled;
    upscaled.reserve(balances.size());
    for (size_t i = 0; i < balances.size(); ++i) {
        upscaled.push_back(fixed_point::mul_down_fixed(balances[i], scaling_factors[i]));
    }
    return upscaled;
}
