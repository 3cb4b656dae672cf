#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Any of these aborts normalization of a single pool; no partial record is produced.
class PoolNormalizeError : public std::runtime_error {
public:
    explicit PoolNormalizeError(const std::string& what) : std::runtime_error(what) {}
};

class FieldParseError : public PoolNormalizeError {
public:
    FieldParseError(const std::string& field, const std::string& pool_address,
                    const std::string& reason)
        : PoolNormalizeError("Failed to parse " + field + " of pool " + pool_address + ": " + reason)
        , field_(field)
        , pool_address_(pool_address) {}
    
    const std::string& field() const { return field_; }
    const std::string& pool_address() const { return pool_address_; }
    
private:
    std::string field_;
    std::string pool_address_;
};

class InvalidTokenDecimals : public PoolNormalizeError {
public:
    explicit InvalidTokenDecimals(int decimals)
        : PoolNormalizeError("Token decimals out of range [0, 18]: " + std::to_string(decimals))
        , decimals_(decimals) {}
    
    int decimals() const { return decimals_; }
    
private:
    int decimals_;
};

// Parallel per-token arrays disagree in length. Indicates a bug, not bad data.
class ArrayLengthMismatch : public PoolNormalizeError {
public:
    ArrayLengthMismatch(size_t expected, size_t actual)
        : PoolNormalizeError("Array length mismatch: expected " + std::to_string(expected) +
                             ", got " + std::to_string(actual))
        , expected_(expected)
        , actual_(actual) {}
    
    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }
    
private:
    size_t expected_;
    size_t actual_;
};
