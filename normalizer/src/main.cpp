#include "config.hpp"
#include "normalize.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <memory>

namespace {

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("poolnorm", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

nlohmann::json read_document(const std::string& path) {
    if (path.empty() || path == "-") {
        return nlohmann::json::parse(std::cin);
    }
    
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    return nlohmann::json::parse(in);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();
        
        if (argc > 2) {
            spdlog::error("Usage: {} [pools.json|-]", argv[0]);
            return 1;
        }
        
        auto document = read_document(argc == 2 ? argv[1] : "");
        
        NormalizeOptions options;
        if (!config.wrapped_native_asset.empty()) {
            options.wrapped_native_asset = config.wrapped_native_asset;
        }
        options.unwrap_native_asset = config.unwrap_native_asset;
        
        auto result = PoolNormalizer::normalize_document(document, options);
        
        std::cout << result.pools.dump(config.json_indent) << std::endl;
        spdlog::info("Normalized {} pools, skipped {}", result.pools.size(), result.skipped);
        
        return result.exit_status();
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
