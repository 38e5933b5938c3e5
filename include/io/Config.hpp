#pragma once
#include "nlohmann/json.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace io {

struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct TwitterConfig {
    std::string api_base;
    std::string token_url;
    std::string bearer_token;
    std::string consumer_key;
    std::string consumer_secret;
    int timeout_s = 30;
};

struct RateLimitConfig {
    bool wait = true;
    int max_retries = 3;
    int fallback_wait_s = 900;
};

struct BulkConfig {
    int chunk_size = 100;
    int timeline_page_size = 200;
    int ids_page_size = 5000;
};

struct LoggingConfig {
    std::string level = "info";
    bool color = true;
};

struct Config {
    TwitterConfig twitter;
    RateLimitConfig rate_limit;
    BulkConfig bulk;
    LoggingConfig logging;
};

// built-in defaults, same shape as the user file
nlohmann::json default_config_json();

// $HOME/.twtoolbox.json, empty path when HOME is unset
std::filesystem::path default_user_config_path();

// defaults <- user_path (if it exists) <- explicit_path (must exist when non-empty)
Config load_config(const std::filesystem::path& user_path,
                   const std::filesystem::path& explicit_path = {});

// validates types and ranges
Config config_from_json(const nlohmann::json& j);

} // namespace io
