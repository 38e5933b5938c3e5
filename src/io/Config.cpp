#include "io/Config.hpp"
#include "io/JsonIO.hpp"

#include <cstdlib>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace io {

json default_config_json() {
    return {
        {"twitter", {
            {"api_base", "https://api.twitter.com/1.1"},
            {"token_url", "https://api.twitter.com/oauth2/token"},
            {"bearer_token", ""},
            {"consumer_key", ""},
            {"consumer_secret", ""},
            {"timeout_s", 30}
        }},
        {"rate_limit", {
            {"wait", true},
            {"max_retries", 3},
            {"fallback_wait_s", 900}
        }},
        {"bulk", {
            {"chunk_size", 100},
            {"timeline_page_size", 200},
            {"ids_page_size", 5000}
        }},
        {"logging", {
            {"level", "info"},
            {"color", true}
        }}
    };
}

fs::path default_user_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return fs::path(home) / ".twtoolbox.json";
}

static const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    const json& s = j.at(key);
    if (!s.is_object()) throw ConfigError(std::string(key) + " must be an object");
    return s;
}

static std::string get_string(const json& s, const char* sec, const char* key, const std::string& def) {
    if (!s.contains(key)) return def;
    if (!s.at(key).is_string()) throw ConfigError(std::string(sec) + "." + key + " must be a string");
    return s.at(key).get<std::string>();
}

static bool get_bool(const json& s, const char* sec, const char* key, bool def) {
    if (!s.contains(key)) return def;
    if (!s.at(key).is_boolean()) throw ConfigError(std::string(sec) + "." + key + " must be a boolean");
    return s.at(key).get<bool>();
}

static int get_int(const json& s, const char* sec, const char* key, int def, int min_value) {
    if (!s.contains(key)) return def;
    if (!s.at(key).is_number_integer()) throw ConfigError(std::string(sec) + "." + key + " must be an integer");
    const int v = s.at(key).get<int>();
    if (v < min_value) {
        throw ConfigError(std::string(sec) + "." + key + " must be >= " + std::to_string(min_value));
    }
    return v;
}

Config config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be an object");

    Config c;

    const json& tw = section(j, "twitter");
    c.twitter.api_base        = get_string(tw, "twitter", "api_base", "https://api.twitter.com/1.1");
    c.twitter.token_url       = get_string(tw, "twitter", "token_url", "https://api.twitter.com/oauth2/token");
    c.twitter.bearer_token    = get_string(tw, "twitter", "bearer_token", "");
    c.twitter.consumer_key    = get_string(tw, "twitter", "consumer_key", "");
    c.twitter.consumer_secret = get_string(tw, "twitter", "consumer_secret", "");
    c.twitter.timeout_s       = get_int(tw, "twitter", "timeout_s", 30, 1);

    const json& rl = section(j, "rate_limit");
    c.rate_limit.wait            = get_bool(rl, "rate_limit", "wait", true);
    c.rate_limit.max_retries     = get_int(rl, "rate_limit", "max_retries", 3, 0);
    c.rate_limit.fallback_wait_s = get_int(rl, "rate_limit", "fallback_wait_s", 900, 0);

    const json& bk = section(j, "bulk");
    c.bulk.chunk_size         = get_int(bk, "bulk", "chunk_size", 100, 1);
    c.bulk.timeline_page_size = get_int(bk, "bulk", "timeline_page_size", 200, 1);
    c.bulk.ids_page_size      = get_int(bk, "bulk", "ids_page_size", 5000, 1);

    const json& lg = section(j, "logging");
    c.logging.level = get_string(lg, "logging", "level", "info");
    c.logging.color = get_bool(lg, "logging", "color", true);

    return c;
}

Config load_config(const fs::path& user_path, const fs::path& explicit_path) {
    json merged = default_config_json();

    if (!user_path.empty() && fs::exists(user_path)) {
        try {
            merged.merge_patch(read_json_file(user_path));
        } catch (const json::exception& e) {
            throw ConfigError("invalid user config " + user_path.string() + ": " + e.what());
        }
    }

    if (!explicit_path.empty()) {
        if (!fs::exists(explicit_path)) throw ConfigError("config file not found: " + explicit_path.string());
        try {
            merged.merge_patch(read_json_file(explicit_path));
        } catch (const json::exception& e) {
            throw ConfigError("invalid config " + explicit_path.string() + ": " + e.what());
        }
    }

    return config_from_json(merged);
}

} // namespace io
