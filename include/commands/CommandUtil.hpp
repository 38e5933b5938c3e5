#pragma once
#include "api/Client.hpp"
#include "io/Config.hpp"
#include "log/Logger.hpp"

#include <cstdint>
#include <memory>
#include <string>

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
bool has_flag(int argc, char** argv, const std::string& key);

// whole-string integer values of a flag; io::ConfigError names the flag otherwise
int64_t parse_int64_arg(const std::string& flag, const std::string& value);
int parse_int_arg(const std::string& flag, const std::string& value);

struct CommandContext {
    io::Config config;
    std::unique_ptr<logging::Logger> log;
    std::unique_ptr<api::Client> client;
};

// config: defaults <- ~/.twtoolbox.json <- config_path; client: MockClient when mock_dir is set
CommandContext make_context(const std::string& logger_name,
                            const std::string& config_path,
                            const std::string& mock_dir);
