#include <catch2/catch.hpp>
#include "../src/normalize.hpp"
#include "../src/canonical_order.hpp"
#include "../src/errors.hpp"
#include <map>
#include <tuple>

using fixed_point::pow10;

namespace {

const std::string WETH = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
const std::string USDC = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
const std::string DAI = "0x6B175474E89094C44Da98b954EedeAC495271d0F";

RawToken make_token(const std::string& address, const std::string& balance,
                    std::optional<int> decimals = std::nullopt) {
    RawToken token;
    token.address = address;
    token.balance = balance;
    token.decimals = decimals;
    return token;
}

// USDC/WETH, the two-token example from the pool docs
RawPool usdc_weth_pool() {
    RawPool pool;
    pool.id = "0x96646936b91d6b9d7d0c47c496afbf3d6ec7b6f8000200000000000000000019";
    pool.address = "0x96646936b91d6B9D7D0c47C496AfBF3D6ec7B6f8";
    pool.tokens.push_back(make_token(USDC, "1000", 6));
    pool.tokens.push_back(make_token(WETH, "2", 18));
    pool.swap_fee = "0.003";
    return pool;
}

// Composable pool listing its own token in the middle
RawPool composable_pool() {
    RawPool pool;
    pool.address = "0x8159462d255c1d24915cb51ec361f700174cd994";
    
    auto wsteth = make_token("0x2f4eb100552ef93840d5adc30560e5513dfffacb", "10", 18);
    wsteth.price_rate = "1.01";
    wsteth.old_price_rate = "1.009";
    wsteth.is_exempt_from_yield_protocol_fee = true;
    pool.tokens.push_back(wsteth);
    pool.tokens.push_back(make_token(pool.address, "2596148429267413.814265248164610048", 18));
    pool.tokens.push_back(make_token("0x82698aecc9e28e9bb27608bd52cf57f704bd1b83", "50", 6));
    
    pool.amp = "1500";
    pool.swap_fee = "0.0004";
    pool.protocol_swap_fee_cache = "0.5";
    pool.protocol_yield_fee_cache = "0.5";
    pool.total_shares = "60.25";
    pool.last_join_exit_invariant = "60.1234";
    pool.ath_rate_product = "1.0025";
    return pool;
}

} // namespace

TEST_CASE("Two-token pool end to end", "[normalize]") {
    auto info = PoolNormalizer::normalize_pool(usdc_weth_pool());
    
    SECTION("Scalars") {
        REQUIRE(info.amp_with_precision == 1000);
        REQUIRE(info.swap_fee_evm == 3 * pow10(15));
        REQUIRE(info.total_shares_evm == 0);
        REQUIRE(info.protocol_swap_fee_pct == "0.0");
        REQUIRE(info.protocol_yield_fee_pct == "0.0");
        REQUIRE(info.last_join_exit_invariant == "0");
        REQUIRE(info.ath_rate_product == "0.0");
    }
    
    SECTION("Per-token columns keep input order") {
        REQUIRE(info.parsed_tokens == std::vector<std::string>{USDC, WETH});
        REQUIRE(info.balances_evm == std::vector<FixedPoint>{pow10(9), 2 * pow10(18)});
        REQUIRE(info.scaling_factors == std::vector<FixedPoint>{pow10(30), pow10(18)});
        REQUIRE(info.upscaled_balances == std::vector<FixedPoint>{1000 * pow10(18), 2 * pow10(18)});
        REQUIRE(info.weights == std::vector<FixedPoint>{pow10(18), pow10(18)});
        REQUIRE(info.price_rates == std::vector<FixedPoint>{pow10(18), pow10(18)});
        REQUIRE(info.old_price_rates == std::vector<FixedPoint>{pow10(18), pow10(18)});
        REQUIRE(info.exempted_tokens == std::vector<bool>{false, false});
    }
    
    SECTION("Derived indices") {
        // 1000e18 (USDC) > 2e18 (WETH)
        REQUIRE(info.higher_balance_token_index == 0);
        REQUIRE(info.bpt_index == -1);
        REQUIRE(info.parsed_tokens_without_bpt.empty());
        REQUIRE(info.balances_evm_without_bpt.empty());
        REQUIRE(info.price_rates_without_bpt.empty());
        REQUIRE(info.scaling_factors_without_bpt.empty());
        REQUIRE(info.upscaled_balances_without_bpt.empty());
    }
}

TEST_CASE("Defaults", "[normalize]") {
    auto pool = usdc_weth_pool();
    pool.tokens[0].decimals.reset();
    pool.tokens[0].balance = "5";
    pool.protocol_swap_fee_cache = "";
    pool.total_shares = "";
    
    auto info = PoolNormalizer::normalize_pool(pool);
    
    REQUIRE(info.balances_evm[0] == 5 * pow10(18));
    REQUIRE(info.scaling_factors[0] == pow10(18));
    REQUIRE(info.weights[0] == pow10(18));
    REQUIRE(info.amp_with_precision == 1000);
    REQUIRE(info.protocol_swap_fee_pct == "0.0");
    REQUIRE(info.total_shares_evm == 0);
}

TEST_CASE("Pool holding its own token", "[normalize]") {
    auto info = PoolNormalizer::normalize_pool(composable_pool());
    const size_t n = 3;
    
    SECTION("Every per-token column has one entry per token") {
        REQUIRE(info.parsed_tokens.size() == n);
        REQUIRE(info.balances_evm.size() == n);
        REQUIRE(info.weights.size() == n);
        REQUIRE(info.price_rates.size() == n);
        REQUIRE(info.old_price_rates.size() == n);
        REQUIRE(info.scaling_factors.size() == n);
        REQUIRE(info.upscaled_balances.size() == n);
        REQUIRE(info.exempted_tokens.size() == n);
    }
    
    SECTION("BPT excluded from the WithoutBpt columns") {
        REQUIRE(info.bpt_index == 1);
        REQUIRE(info.parsed_tokens_without_bpt ==
                std::vector<std::string>{info.parsed_tokens[0], info.parsed_tokens[2]});
        REQUIRE(info.balances_evm_without_bpt ==
                std::vector<FixedPoint>{info.balances_evm[0], info.balances_evm[2]});
        REQUIRE(info.price_rates_without_bpt ==
                std::vector<FixedPoint>{info.price_rates[0], info.price_rates[2]});
        REQUIRE(info.scaling_factors_without_bpt ==
                std::vector<FixedPoint>{info.scaling_factors[0], info.scaling_factors[2]});
        REQUIRE(info.upscaled_balances_without_bpt ==
                std::vector<FixedPoint>{info.upscaled_balances[0], info.upscaled_balances[2]});
    }
    
    SECTION("Rates feed the scaling factors") {
        REQUIRE(info.price_rates[0] == 101 * pow10(16));
        REQUIRE(info.old_price_rates[0] == 1009 * pow10(15));
        REQUIRE(info.scaling_factors[0] == 101 * pow10(16));
        REQUIRE(info.upscaled_balances[0] == 101 * pow10(17));
        REQUIRE(info.exempted_tokens == std::vector<bool>{true, false, false});
        REQUIRE(info.higher_balance_token_index == 1);
    }
    
    SECTION("Pool-level fields") {
        REQUIRE(info.amp_with_precision == 1500000);
        REQUIRE(info.swap_fee_evm == 4 * pow10(14));
        REQUIRE(info.total_shares_evm == 6025 * pow10(16));
        REQUIRE(info.protocol_swap_fee_pct == "0.5");
        REQUIRE(info.protocol_yield_fee_pct == "0.5");
        REQUIRE(info.last_join_exit_invariant == "60.1234");
        REQUIRE(info.ath_rate_product == "1.0025");
    }
}

TEST_CASE("Pool address matching is case-sensitive", "[normalize]") {
    auto pool = composable_pool();
    pool.address = "0x8159462D255C1D24915CB51EC361F700174CD994";
    
    auto info = PoolNormalizer::normalize_pool(pool);
    
    REQUIRE(info.bpt_index == -1);
    REQUIRE(info.parsed_tokens_without_bpt.empty());
}

TEST_CASE("Canonical ordering with a wrapped native asset", "[normalize]") {
    RawPool pool;
    pool.address = "0x5c6ee304399dbdb9c8ef030ab642b10820db8f56";
    auto weth = make_token(WETH, "2", 18);
    weth.weight = "0.2";
    auto usdc = make_token(USDC, "1000", 6);
    usdc.weight = "0.5";
    usdc.is_exempt_from_yield_protocol_fee = true;
    auto dai = make_token(DAI, "750.5", 18);
    dai.weight = "0.3";
    dai.price_rate = "1.02";
    pool.tokens = {weth, usdc, dai};
    pool.swap_fee = "0.01";
    
    auto unsorted = PoolNormalizer::normalize_pool(pool);
    
    NormalizeOptions options;
    options.wrapped_native_asset = WETH;
    auto sorted = PoolNormalizer::normalize_pool(pool, options);
    
    SECTION("Tokens follow address order") {
        REQUIRE(sorted.parsed_tokens == std::vector<std::string>{DAI, USDC, WETH});
    }
    
    SECTION("Per-token values travel with their address") {
        using Row = std::tuple<FixedPoint, FixedPoint, FixedPoint, FixedPoint, FixedPoint, bool>;
        auto rows = [](const NormalizedPoolInfo& info) {
            std::map<std::string, Row> result;
            for (size_t i = 0; i < info.parsed_tokens.size(); ++i) {
                result[info.parsed_tokens[i]] = Row{info.balances_evm[i], info.weights[i],
                                                    info.price_rates[i], info.scaling_factors[i],
                                                    info.upscaled_balances[i],
                                                    info.exempted_tokens[i]};
            }
            return result;
        };
        bool same_rows = rows(sorted) == rows(unsorted);
        REQUIRE(same_rows);
    }
    
    SECTION("Derived index follows the new order") {
        // upscaled: WETH 2e18, USDC 1000e18, DAI 765.51e18
        REQUIRE(unsorted.higher_balance_token_index == 1);
        REQUIRE(sorted.higher_balance_token_index == 1);
        REQUIRE(sorted.upscaled_balances[0] == fixed_point::parse_fixed("765.51", 18));
    }
    
    SECTION("Unwrap rewrites the wrapped token but keeps its position") {
        options.unwrap_native_asset = true;
        auto unwrapped = PoolNormalizer::normalize_pool(pool, options);
        
        REQUIRE(unwrapped.parsed_tokens ==
                std::vector<std::string>{DAI, USDC, NATIVE_ASSET_ADDRESS});
        REQUIRE(unwrapped.balances_evm[2] == 2 * pow10(18));
        REQUIRE(unwrapped.weights[2] == 2 * pow10(17));
    }
    
    SECTION("Unwrap without reordering keeps input order") {
        NormalizeOptions unwrap_only;
        unwrap_only.unwrap_native_asset = true;
        auto info = PoolNormalizer::normalize_pool(pool, unwrap_only);
        REQUIRE(info.parsed_tokens == std::vector<std::string>{WETH, USDC, DAI});
    }
}

TEST_CASE("Reordering a pool that holds its own token", "[normalize]") {
    auto pool = composable_pool();
    NormalizeOptions options;
    options.wrapped_native_asset = WETH;
    
    auto info = PoolNormalizer::normalize_pool(pool, options);
    
    // 0x2f4e < 0x8159 < 0x8269: already canonical
    REQUIRE(info.bpt_index == 1);
    REQUIRE(info.parsed_tokens_without_bpt.size() == 2);
    REQUIRE(info.parsed_tokens_without_bpt[1] == "0x82698aecc9e28e9bb27608bd52cf57f704bd1b83");
}

TEST_CASE("Normalization is repeatable", "[normalize]") {
    NormalizeOptions options;
    options.wrapped_native_asset = WETH;
    
    auto first = PoolNormalizer::normalize_pool(composable_pool(), options);
    auto second = PoolNormalizer::normalize_pool(composable_pool(), options);
    
    REQUIRE(nlohmann::json(first).dump() == nlohmann::json(second).dump());
}

TEST_CASE("Normalization failures", "[normalize]") {
    auto pool = usdc_weth_pool();
    
    SECTION("Missing swap fee") {
        pool.swap_fee.reset();
        try {
            PoolNormalizer::normalize_pool(pool);
            FAIL("expected FieldParseError");
        } catch (const FieldParseError& e) {
            REQUIRE(e.field() == "swapFee");
            REQUIRE(e.pool_address() == pool.address);
        }
    }
    
    SECTION("Malformed balance names the token field") {
        pool.tokens[1].balance = "2,5";
        try {
            PoolNormalizer::normalize_pool(pool);
            FAIL("expected FieldParseError");
        } catch (const FieldParseError& e) {
            REQUIRE(e.field() == "tokens[1].balance");
        }
    }
    
    SECTION("Missing balance") {
        pool.tokens[0].balance.reset();
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), FieldParseError);
    }
    
    SECTION("Balance more precise than the token") {
        pool.tokens[0].balance = "1000.0000001";
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), FieldParseError);
    }
    
    SECTION("Negative amounts") {
        pool.tokens[0].balance = "-1";
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), FieldParseError);
    }
    
    SECTION("Empty string is not defaulted for MISSING-only fields") {
        pool.tokens[0].weight = "";
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), FieldParseError);
    }
    
    SECTION("Malformed amp") {
        pool.amp = "1.0001";
        try {
            PoolNormalizer::normalize_pool(pool);
            FAIL("expected FieldParseError");
        } catch (const FieldParseError& e) {
            REQUIRE(e.field() == "amp");
        }
    }
    
    SECTION("Decimals out of range") {
        pool.tokens[1].decimals = 19;
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), InvalidTokenDecimals);
    }
    
    SECTION("Overflowing price rate") {
        pool.tokens[0].price_rate = std::string(50, '9');
        REQUIRE_THROWS_AS(PoolNormalizer::normalize_pool(pool), FieldParseError);
    }
}

TEST_CASE("Empty pool", "[normalize]") {
    RawPool pool;
    pool.address = "0x0000000000000000000000000000000000000001";
    pool.swap_fee = "0";
    
    auto info = PoolNormalizer::normalize_pool(pool);
    
    REQUIRE(info.parsed_tokens.empty());
    REQUIRE(info.higher_balance_token_index == -1);
    REQUIRE(info.bpt_index == -1);
}

TEST_CASE("Normalizing a document of pools", "[normalize]") {
    auto usdc_weth = R"({
        "id": "usdc-weth",
        "address": "0x96646936b91d6b9d7d0c47c496afbf3d6ec7b6f8",
        "swapFee": "0.003",
        "tokens": [
            {"address": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48", "balance": "1000", "decimals": 6},
            {"address": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2", "balance": "2", "decimals": 18}
        ]
    })";
    auto no_swap_fee = R"({
        "id": "no-fee",
        "address": "0x8159462d255c1d24915cb51ec361f700174cd994",
        "tokens": [{"address": "0x2f4eb100552ef93840d5adc30560e5513dfffacb", "balance": "10"}]
    })";
    
    SECTION("Failed pools are skipped, the rest keep input order") {
        auto document = nlohmann::json::array({nlohmann::json::parse(usdc_weth),
                                               nlohmann::json::parse(no_swap_fee)});
        
        auto result = PoolNormalizer::normalize_document(document);
        
        REQUIRE(result.pools.size() == 1);
        REQUIRE(result.pools[0]["parsedTokens"][0] == "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
        REQUIRE(result.pools[0]["swapFeeEvm"] == "3000000000000000");
        REQUIRE(result.skipped == 1);
        REQUIRE(result.exit_status() == DocumentResult::EXIT_SKIPPED_POOLS);
    }
    
    SECTION("Order of several good pools is preserved") {
        auto second = nlohmann::json::parse(usdc_weth);
        second["swapFee"] = "0.01";
        auto document = nlohmann::json::array({nlohmann::json::parse(usdc_weth), second});
        
        auto result = PoolNormalizer::normalize_document(document);
        
        REQUIRE(result.pools.size() == 2);
        REQUIRE(result.pools[0]["swapFeeEvm"] == "3000000000000000");
        REQUIRE(result.pools[1]["swapFeeEvm"] == "10000000000000000");
        REQUIRE(result.exit_status() == DocumentResult::EXIT_OK);
    }
    
    SECTION("A single pool object is wrapped into an array") {
        auto result = PoolNormalizer::normalize_document(nlohmann::json::parse(usdc_weth));
        
        REQUIRE(result.pools.is_array());
        REQUIRE(result.pools.size() == 1);
        REQUIRE(result.pools[0]["bptIndex"] == -1);
        REQUIRE(result.skipped == 0);
        REQUIRE(result.exit_status() == DocumentResult::EXIT_OK);
    }
    
    SECTION("Entries that are not pools are skipped") {
        auto document = nlohmann::json::array({42, nlohmann::json::parse(usdc_weth)});
        
        auto result = PoolNormalizer::normalize_document(document);
        
        REQUIRE(result.pools.size() == 1);
        REQUIRE(result.skipped == 1);
    }
    
    SECTION("An empty array normalizes to an empty array") {
        auto result = PoolNormalizer::normalize_document(nlohmann::json::array());
        REQUIRE(result.pools.empty());
        REQUIRE(result.exit_status() == DocumentResult::EXIT_OK);
    }
}
