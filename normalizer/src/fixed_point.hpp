#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <vector>

// 256-bit EVM-style integers. The checked backend throws std::overflow_error
// instead of wrapping.
using FixedPoint = boost::multiprecision::checked_int256_t;

namespace fixed_point {
    constexpr int DEFAULT_DECIMALS = 18;
    constexpr int AMP_PRECISION = 3; // precision 1000
    constexpr int MAX_DECIMALS = 77;

    FixedPoint pow10(int exponent);
    const FixedPoint& one(); // 1e18

    // Decimal string in human units -> integer scaled by 10^decimals.
    // Throws std::invalid_argument on malformed text or a fraction longer
    // than `decimals`, std::overflow_error past 256 bits.
    FixedPoint parse_fixed(const std::string& text, int decimals);

    // Inverse of parse_fixed: "1.5", "1.0", "-0.25"; bare integer when decimals == 0.
    std::string format_fixed(const FixedPoint& value, int decimals);

    // Plain base-10 integer, no scaling.
    std::string to_string(const FixedPoint& value);
    FixedPoint from_string(const std::string& digits);

    // floor(a * b / 1e18), operands are non-negative
    FixedPoint mul_down_fixed(const FixedPoint& a, const FixedPoint& b);

    // First occurrence wins on ties; -1 when empty
    int index_of_max(const std::vector<FixedPoint>& values);
}
