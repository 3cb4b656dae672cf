#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Normalization
    std::string wrapped_native_asset; // empty = keep input token order
    bool unwrap_native_asset;
    
    // Output
    int json_indent; // -1 = compact
    
    // Service
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
