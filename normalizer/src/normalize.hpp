#pragma once

#include "pool_types.hpp"
#include <optional>
#include <string>

struct NormalizeOptions {
    // When set, token columns are put in canonical order.
    std::optional<std::string> wrapped_native_asset;
    // Rewrite the wrapped native token to the native sentinel address.
    bool unwrap_native_asset = false;
};

// Outcome of normalizing a JSON document of raw pools.
struct DocumentResult {
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_SKIPPED_POOLS = 2;
    
    nlohmann::json pools = nlohmann::json::array(); // input order, failed pools left out
    size_t skipped = 0;
    
    int exit_status() const { return skipped > 0 ? EXIT_SKIPPED_POOLS : EXIT_OK; }
};

class PoolNormalizer {
public:
    // Converts a raw pool snapshot into EVM fixed-point amounts. Pure; safe to
    // call concurrently for different pools.
    // Throws FieldParseError, InvalidTokenDecimals or ArrayLengthMismatch and
    // never returns a partial record.
    static NormalizedPoolInfo normalize_pool(const RawPool& pool,
                                             const NormalizeOptions& options = NormalizeOptions());
    
    // `document` is one pool object or an array of them. A pool that fails is
    // logged and skipped; the rest are still normalized.
    static DocumentResult normalize_document(const nlohmann::json& document,
                                             const NormalizeOptions& options = NormalizeOptions());
};
