#pragma once

#include "fixed_point.hpp"
#include <optional>
#include <vector>

class ScalingFactorComputer {
public:
    static constexpr int MAX_TOKEN_DECIMALS = 18;
    
    // Throws InvalidTokenDecimals outside [0, 18]
    static void check_decimals(int decimals);
    
    // 1e18 * 10^(18 - decimals)
    static FixedPoint base_factor(int decimals);
    
    // base_factor(decimals) * price_rate, rounded down. A missing rate counts as 1.0.
    static FixedPoint scaling_factor(int decimals,
                                     const std::optional<FixedPoint>& price_rate = std::nullopt);
};

class Upscaler {
public:
    // Elementwise mul_down_fixed; throws ArrayLengthMismatch if the lengths differ.
    static std::vector<FixedPoint> upscale(const std::vector<FixedPoint>& balances,
                                           const std::vector<FixedPoint>& scaling_factors);
};
