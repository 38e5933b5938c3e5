#pragma once
#include "nlohmann/json.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace io {

// whole-file JSON document; throws std::runtime_error when the file cannot be opened
nlohmann::json read_json_file(const std::filesystem::path& path);

// one compact record + '\n'
void write_json_line(std::ostream& out, const nlohmann::json& j);

// calls fn(line_no, line) for every non-blank line (line_no is 1-based)
void for_each_line(const std::filesystem::path& path,
                   const std::function<void(size_t, const std::string&)>& fn);

// parses every non-blank line; the error names path and line on bad JSON
std::vector<nlohmann::json> read_json_lines(const std::filesystem::path& path);

std::string trim(const std::string& s);

} // namespace io
