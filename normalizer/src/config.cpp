#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    return util::parse_bool(val, default_val);
}

Config Config::from_env() {
    Config cfg;
    
    cfg.wrapped_native_asset = get_env("WRAPPED_NATIVE_ASSET");
    cfg.unwrap_native_asset = get_env_bool("UNWRAP_NATIVE_ASSET", false);
    
    cfg.json_indent = get_env_int("PRETTY_JSON_INDENT", -1);
    
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (!wrapped_native_asset.empty() && !util::is_valid_evm_address(wrapped_native_asset)) {
        throw std::runtime_error("WRAPPED_NATIVE_ASSET is not a valid address: " +
                                 wrapped_native_asset);
    }
    if (unwrap_native_asset && wrapped_native_asset.empty()) {
        spdlog::warn("UNWRAP_NATIVE_ASSET is set without WRAPPED_NATIVE_ASSET, nothing to unwrap");
    }
    
    spdlog::debug("Configuration validated successfully");
    spdlog::debug("  Wrapped native asset: {}",
                  wrapped_native_asset.empty() ? "<none>" : wrapped_native_asset);
    spdlog::debug("  Unwrap native asset: {}", unwrap_native_asset);
}
