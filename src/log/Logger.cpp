#include "log/Logger.hpp"
#include "io/Config.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <ostream>
#include <typeinfo>

#include <cxxabi.h>

namespace logging {

static const char* kReset = "\x1b[0m";
static const char* kBold  = "\x1b[1m";
static const char* kGreen = "\x1b[32m";
static const char* kBlue  = "\x1b[34m";
static const char* kCyan  = "\x1b[36m";

const char* level_name(Level lv) {
    switch (lv) {
        case Level::debug:   return "DEBUG";
        case Level::info:    return "INFO";
        case Level::warning: return "WARNING";
        case Level::error:   return "ERROR";
    }
    return "UNKNOWN";
}

Level parse_level(const std::string& s) {
    std::string l;
    l.reserve(s.size());
    for (unsigned char c : s) l.push_back((char)std::tolower(c));

    if (l == "debug") return Level::debug;
    if (l == "info") return Level::info;
    if (l == "warning" || l == "warn") return Level::warning;
    if (l == "error") return Level::error;
    throw io::ConfigError("unknown log level: " + s);
}

static std::string type_name(const std::type_info& ti) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(ti.name(), nullptr, nullptr, &status);
    if (status != 0 || !demangled) return ti.name();
    std::string out(demangled);
    std::free(demangled);
    return out;
}

void Logger::error(const std::string& msg, const std::exception& e) {
    log(Level::error, msg + ": " + type_name(typeid(e)) + ": " + e.what());
}

static std::string timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

StreamLogger::StreamLogger(const std::string& name, std::ostream& out, Level min_level, bool color)
    : name_(name), out_(out), min_level_(min_level), color_(color) {}

void StreamLogger::log(Level lv, const std::string& msg) {
    if (lv < min_level_) return;

    if (color_) {
        out_ << kGreen << timestamp_now() << kReset << " "
             << kBlue << "[" << kCyan << name_ << kBlue << "]" << kReset << " "
             << kBold << level_name(lv) << kReset << " "
             << msg << "\n";
    } else {
        out_ << timestamp_now() << " [" << name_ << "] " << level_name(lv) << " " << msg << "\n";
    }
    out_.flush();
}

} // namespace logging
