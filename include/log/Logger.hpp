#pragma once
#include <exception>
#include <iosfwd>
#include <string>

namespace logging {

enum class Level { debug = 0, info = 1, warning = 2, error = 3 };

const char* level_name(Level lv);

// "debug" | "info" | "warning" | "error" (case-insensitive), throws io::ConfigError otherwise
Level parse_level(const std::string& s);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(Level lv, const std::string& msg) = 0;

    void debug(const std::string& msg) { log(Level::debug, msg); }
    void info(const std::string& msg) { log(Level::info, msg); }
    void warning(const std::string& msg) { log(Level::warning, msg); }
    void error(const std::string& msg) { log(Level::error, msg); }

    // error event with the exception's type and message appended
    void error(const std::string& msg, const std::exception& e);
};

class NullLogger final : public Logger {
public:
    void log(Level, const std::string&) override {}
};

class StreamLogger final : public Logger {
    std::string name_;
    std::ostream& out_;
    Level min_level_;
    bool color_;

public:
    StreamLogger(const std::string& name, std::ostream& out, Level min_level = Level::info, bool color = false);

    void log(Level lv, const std::string& msg) override;

    void set_min_level(Level lv) { min_level_ = lv; }
    Level min_level() const { return min_level_; }
};

} // namespace logging
