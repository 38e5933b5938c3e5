#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace bulk {

class MalformedRecordError : public std::runtime_error {
    std::string path_;
    size_t line_;

public:
    MalformedRecordError(const std::string& path, size_t line, const std::string& why)
        : std::runtime_error(path + ":" + std::to_string(line) + ": " + why), path_(path), line_(line) {}

    const std::string& path() const { return path_; }
    size_t line() const { return line_; }
};

// Max integer "id" over every record of a line-delimited JSON file; nullopt when the
// file holds no records. Full scan on every call. Blank lines are ignored; any other
// line that is not an object with an integer "id" throws MalformedRecordError.
std::optional<int64_t> latest_id(const std::filesystem::path& path);

} // namespace bulk
