#pragma once
#include "api/Client.hpp"
#include "bulk/BulkRunner.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace io {

// one token per line, trimmed; blank lines and lines starting with '#' are ignored
std::vector<std::string> read_lines(const std::filesystem::path& path);

// read_lines + int64 parse; a bad token throws ConfigError with file and line
std::vector<int64_t> read_user_ids(const std::filesystem::path& path);

// ConfigError when both are empty
void ensure_at_least_one(const std::vector<int64_t>& user_ids, const std::vector<std::string>& screen_names);

// ConfigError unless exactly one is set
api::UserRef ensure_only_one(const std::optional<int64_t>& user_id, const std::optional<std::string>& screen_name);

// ids first, then names; identity = decimal id or screen name
std::vector<bulk::WorkItem> make_work_items(const std::vector<int64_t>& user_ids,
                                            const std::vector<std::string>& screen_names);

} // namespace io
