#pragma once
#include "log/Logger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace testutil {

// fresh directory under the system temp dir, removed on destruction
class ScratchDir {
public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("twtoolbox-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class RecordingLogger final : public logging::Logger {
public:
    std::vector<std::pair<logging::Level, std::string>> events;

    void log(logging::Level lv, const std::string& msg) override { events.emplace_back(lv, msg); }

    size_t count(logging::Level lv) const {
        size_t n = 0;
        for (const auto& e : events) if (e.first == lv) ++n;
        return n;
    }

    bool contains(logging::Level lv, const std::string& needle) const {
        for (const auto& e : events) {
            if (e.first == lv && e.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::out | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_file_lines(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

} // namespace testutil
