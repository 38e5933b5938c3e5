#include "commands/CommandUtil.hpp"

#include "api/MockClient.hpp"
#include "api/RestClient.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <unistd.h>

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

int64_t parse_int64_arg(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int64_t v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw io::ConfigError(flag + " expects an integer, got: " + value);
    }
    return v;
}

int parse_int_arg(const std::string& flag, const std::string& value) {
    const int64_t v = parse_int64_arg(flag, value);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw io::ConfigError(flag + " is out of range: " + value);
    }
    return (int)v;
}

CommandContext make_context(const std::string& logger_name,
                            const std::string& config_path,
                            const std::string& mock_dir) {
    CommandContext ctx;
    ctx.config = io::load_config(io::default_user_config_path(), config_path);

    const bool color = ctx.config.logging.color && ::isatty(STDERR_FILENO);
    ctx.log = std::make_unique<logging::StreamLogger>(
        logger_name, std::cerr, logging::parse_level(ctx.config.logging.level), color);

    if (!mock_dir.empty()) {
        ctx.client = std::make_unique<api::MockClient>(mock_dir);
    } else {
        ctx.client = std::make_unique<api::RestClient>(api::RestOptions::from_config(ctx.config), *ctx.log);
    }
    return ctx;
}
