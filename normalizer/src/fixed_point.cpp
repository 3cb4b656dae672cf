#include "fixed_point.hpp"
#include <stdexcept>

namespace fixed_point {

namespace {

FixedPoint accumulate_digits(const std::string& digits) {
    FixedPoint value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid digit in \"" + digits + "\"");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

FixedPoint pow10(int exponent) {
    if (exponent < 0 || exponent > MAX_DECIMALS) {
        throw std::invalid_argument("power of ten out of range: " + std::to_string(exponent));
    }
    FixedPoint result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

const FixedPoint& one() {
    static const FixedPoint value = pow10(DEFAULT_DECIMALS);
    return value;
}

FixedPoint parse_fixed(const std::string& text, int decimals) {
    if (decimals < 0 || decimals > MAX_DECIMALS) {
        throw std::invalid_argument("unsupported decimals: " + std::to_string(decimals));
    }
    
    std::string value = text;
    bool negative = !value.empty() && value[0] == '-';
    if (negative) {
        value.erase(0, 1);
    }
    
    if (value.empty() || value.find_first_not_of("0123456789.") != std::string::npos) {
        throw std::invalid_argument("invalid decimal value \"" + text + "\"");
    }
    if (value == ".") {
        throw std::invalid_argument("missing value \"" + text + "\"");
    }
    
    auto dot = value.find('.');
    std::string whole = value.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : value.substr(dot + 1);
    if (fraction.find('.') != std::string::npos) {
        throw std::invalid_argument("too many decimal points \"" + text + "\"");
    }
    
    if (whole.empty()) whole = "0";
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    if (static_cast<int>(fraction.size()) > decimals) {
        throw std::invalid_argument("fractional component exceeds " +
                                    std::to_string(decimals) + " decimals \"" + text + "\"");
    }
    fraction.append(static_cast<size_t>(decimals) - fraction.size(), '0');
    
    FixedPoint result = accumulate_digits(whole) * pow10(decimals) + accumulate_digits(fraction);
    return negative ? FixedPoint(-result) : result;
}

std::string format_fixed(const FixedPoint& value, int decimals) {
    FixedPoint multiplier = pow10(decimals);
    bool negative = value < 0;
    FixedPoint magnitude = negative ? FixedPoint(-value) : value;
    
    std::string whole = FixedPoint(magnitude / multiplier).str();
    std::string result = whole;
    
    if (decimals > 0) {
        std::string fraction = FixedPoint(magnitude % multiplier).str();
        fraction.insert(0, static_cast<size_t>(decimals) - fraction.size(), '0');
        auto last = fraction.find_last_not_of('0');
        fraction = last == std::string::npos ? "0" : fraction.substr(0, last + 1);
        result += "." + fraction;
    }
    
    return negative ? "-" + result : result;
}

std::string to_string(const FixedPoint& value) {
    return value.str();
}

FixedPoint from_string(const std::string& digits) {
    bool negative = !digits.empty() && digits[0] == '-';
    std::string magnitude = negative ? digits.substr(1) : digits;
    if (magnitude.empty()) {
        throw std::invalid_argument("empty integer string \"" + digits + "\"");
    }
    FixedPoint value = accumulate_digits(magnitude);
    return negative ? FixedPoint(-value) : value;
}

FixedPoint mul_down_fixed(const FixedPoint& a, const FixedPoint& b) {
    return (a * b) / one();
}

int index_of_max(const std::vector<FixedPoint>& values) {
    if (values.empty()) return -1;
    
    int best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        // strict comparison keeps the first occurrence on ties
        if (values[i] > values[best]) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

} // namespace fixed_point
