#include "api/RestClient.hpp"
#include "api/ProcUtil.hpp"
#include "io/JsonIO.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace api {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string join(const std::vector<std::string>& v, char sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out.push_back(sep);
        out += v[i];
    }
    return out;
}

std::string url_encode(const std::string& s) {
    const char* hex = "0123456789ABCDEF";
    std::string o;
    o.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            o.push_back((char)c);
        } else {
            o.push_back('%');
            o.push_back(hex[c >> 4]);
            o.push_back(hex[c & 0xF]);
        }
    }
    return o;
}

std::string base64_encode(const std::string& s) {
    static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((s.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i + 2 < s.size()) {
        const uint32_t n = ((uint32_t)(unsigned char)s[i] << 16) |
                           ((uint32_t)(unsigned char)s[i + 1] << 8) |
                           (uint32_t)(unsigned char)s[i + 2];
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
        out.push_back(tbl[(n >> 6) & 63]);
        out.push_back(tbl[n & 63]);
        i += 3;
    }

    const size_t rest = s.size() - i;
    if (rest == 1) {
        const uint32_t n = (uint32_t)(unsigned char)s[i] << 16;
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = ((uint32_t)(unsigned char)s[i] << 16) | ((uint32_t)(unsigned char)s[i + 1] << 8);
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
        out.push_back(tbl[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

RestOptions RestOptions::from_config(const io::Config& cfg) {
    RestOptions o;
    o.api_base           = cfg.twitter.api_base;
    o.token_url          = cfg.twitter.token_url;
    o.bearer_token       = cfg.twitter.bearer_token;
    o.consumer_key       = cfg.twitter.consumer_key;
    o.consumer_secret    = cfg.twitter.consumer_secret;
    o.timeout_s          = cfg.twitter.timeout_s;
    o.wait_on_rate_limit = cfg.rate_limit.wait;
    o.max_retries        = cfg.rate_limit.max_retries;
    o.fallback_wait_s    = cfg.rate_limit.fallback_wait_s;
    o.timeline_page_size = cfg.bulk.timeline_page_size;
    o.ids_page_size      = cfg.bulk.ids_page_size;
    return o;
}

RestClient::RestClient(RestOptions opts, logging::Logger& log)
    : opts_(std::move(opts)), log_(log), token_(opts_.bearer_token) {
    if (opts_.scratch_dir.empty()) {
        static std::atomic<unsigned> seq{0};
        opts_.scratch_dir = fs::temp_directory_path() /
                            ("twtoolbox-" + std::to_string(::getpid()) + "-" + std::to_string(seq++));
        owns_scratch_ = true;
    }
    fs::create_directories(opts_.scratch_dir);
    if (owns_scratch_) fs::permissions(opts_.scratch_dir, fs::perms::owner_all);
}

RestClient::~RestClient() {
    if (!owns_scratch_) return;
    std::error_code ec;
    fs::remove_all(opts_.scratch_dir, ec);
    if (ec) log_.warning("failed to remove scratch directory " + opts_.scratch_dir.string() + ": " + ec.message());
}

// created empty and owner-only before anything secret is written to it
static void open_private(std::ofstream& f, const fs::path& p) {
    { std::ofstream touch(p, std::ios::out | std::ios::app); }
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write);
    f.open(p, std::ios::out | std::ios::trunc);
    if (!f) throw std::runtime_error("failed to write scratch file: " + p.string());
}

// Headers and body go through files so that secrets never appear on the command line.
RestClient::HttpResponse RestClient::run_curl(const std::string& url,
                                              const std::string& auth_header,
                                              const std::string& post_data) {
    const fs::path hdr_in  = opts_.scratch_dir / "request_headers.txt";
    const fs::path hdr_out = opts_.scratch_dir / "response_headers.txt";
    const fs::path body    = opts_.scratch_dir / "response_body.json";
    const fs::path payload = opts_.scratch_dir / "request_body.txt";

    {
        std::ofstream f;
        open_private(f, hdr_in);
        f << auth_header << "\n";
        if (!post_data.empty()) f << "Content-Type: application/x-www-form-urlencoded;charset=UTF-8\n";
        f.close();
        if (!f) throw std::runtime_error("failed to write request headers: " + hdr_in.string());
    }

    std::ostringstream cmd;
    cmd << procutil::shell_quote(opts_.curl) << " -s"
        << " --max-time " << opts_.timeout_s
        << " -H @" << procutil::shell_quote(hdr_in.string())
        << " -D " << procutil::shell_quote(hdr_out.string())
        << " -o " << procutil::shell_quote(body.string())
        << " -w '%{http_code}'";

    if (!post_data.empty()) {
        std::ofstream f;
        open_private(f, payload);
        f << post_data;
        f.close();
        if (!f) throw std::runtime_error("failed to write request body: " + payload.string());
        cmd << " --data-binary @" << procutil::shell_quote(payload.string());
    }

    cmd << " " << procutil::shell_quote(url);

    int code = 0;
    const std::string out = procutil::run_capture_stdout(cmd.str(), code);
    if (code != 0) {
        throw ApiError("transport error: curl exited with " + std::to_string(code) + " for " + url);
    }

    HttpResponse r;
    try {
        r.status = std::stoi(io::trim(out));
    } catch (const std::logic_error&) {
        throw ApiError("transport error: unexpected curl output for " + url);
    }

    std::istringstream hs(read_all(hdr_out));
    std::string line;
    while (std::getline(hs, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        r.headers[lower(io::trim(line.substr(0, colon)))] = io::trim(line.substr(colon + 1));
    }

    r.body = read_all(body);
    return r;
}

const std::string& RestClient::bearer() {
    if (!token_.empty()) return token_;

    if (opts_.consumer_key.empty() || opts_.consumer_secret.empty()) {
        throw ApiError("no credentials configured: set twitter.bearer_token or consumer_key/consumer_secret", 401);
    }

    const std::string basic = base64_encode(url_encode(opts_.consumer_key) + ":" + url_encode(opts_.consumer_secret));
    HttpResponse r = run_curl(opts_.token_url, "Authorization: Basic " + basic, "grant_type=client_credentials");
    if (r.status != 200) {
        throw ApiError("application auth failed with HTTP " + std::to_string(r.status), r.status);
    }

    json j;
    try {
        j = json::parse(r.body);
    } catch (const json::parse_error&) {
        throw ApiError("application auth returned invalid JSON", r.status);
    }
    if (!j.is_object() || j.value("token_type", "") != "bearer" || !j.contains("access_token") ||
        !j["access_token"].is_string()) {
        throw ApiError("application auth returned no bearer token", r.status);
    }

    token_ = j["access_token"].get<std::string>();
    return token_;
}

int RestClient::seconds_until_reset(const HttpResponse& r) const {
    auto it = r.headers.find("x-rate-limit-reset");
    if (it == r.headers.end()) return opts_.fallback_wait_s;

    long long reset = 0;
    try {
        reset = std::stoll(it->second);
    } catch (const std::logic_error&) {
        return opts_.fallback_wait_s;
    }

    const long long now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const long long wait = reset - now + 1;
    return wait > 0 ? (int)wait : 1;
}

json RestClient::get_json(const std::string& endpoint, const Params& params) {
    std::string url = opts_.api_base + "/" + endpoint;
    for (size_t i = 0; i < params.size(); ++i) {
        url += (i == 0 ? '?' : '&');
        url += url_encode(params[i].first) + "=" + url_encode(params[i].second);
    }

    for (int attempt = 0;; ++attempt) {
        HttpResponse r = run_curl(url, "Authorization: Bearer " + bearer(), "");

        if (r.status == 429 && opts_.wait_on_rate_limit && attempt < opts_.max_retries) {
            const int wait = seconds_until_reset(r);
            log_.warning("rate limit reached on " + endpoint + ", sleeping " + std::to_string(wait) + "s");
            std::this_thread::sleep_for(std::chrono::seconds(wait));
            continue;
        }

        json j;
        try {
            j = json::parse(r.body);
        } catch (const json::parse_error&) {
            if (r.status >= 200 && r.status < 300) {
                throw ApiError("invalid JSON from " + endpoint, r.status);
            }
            throw ApiError(endpoint + " failed with HTTP " + std::to_string(r.status), r.status);
        }

        if (r.status >= 200 && r.status < 300) return j;

        std::string msg = endpoint + " failed with HTTP " + std::to_string(r.status);
        int code = 0;
        if (j.is_object() && j.contains("errors") && j["errors"].is_array() && !j["errors"].empty()) {
            const json& e = j["errors"][0];
            if (e.is_object()) {
                if (e.contains("message") && e["message"].is_string()) msg += ": " + e["message"].get<std::string>();
                if (e.contains("code") && e["code"].is_number_integer()) code = e["code"].get<int>();
            }
        }
        throw ApiError(msg, r.status, code);
    }
}

void RestClient::user_timeline(const UserRef& user, std::optional<int64_t> since_id, const RecordSink& sink) {
    std::optional<int64_t> max_id;

    while (true) {
        Params params = {
            {user.param_name(), user.value},
            {"count", std::to_string(opts_.timeline_page_size)},
            {"include_rts", "true"},
            {"tweet_mode", "extended"}
        };
        if (since_id) params.emplace_back("since_id", std::to_string(*since_id));
        if (max_id) params.emplace_back("max_id", std::to_string(*max_id));

        const json page = get_json("statuses/user_timeline.json", params);
        if (!page.is_array() || page.empty()) break;

        int64_t lowest = 0;
        bool any = false;
        for (const auto& t : page) {
            if (!t.is_object() || !t.contains("id") || !t["id"].is_number_integer()) continue;
            const int64_t id = t["id"].get<int64_t>();
            if (!any || id < lowest) lowest = id;
            any = true;
            sink(t);
        }
        if (!any) break;
        max_id = lowest - 1;
    }
}

void RestClient::cursored_ids(const std::string& endpoint, const UserRef& user, const IdSink& sink) {
    int64_t cursor = -1;

    while (cursor != 0) {
        const Params params = {
            {user.param_name(), user.value},
            {"count", std::to_string(opts_.ids_page_size)},
            {"cursor", std::to_string(cursor)}
        };

        const json page = get_json(endpoint, params);
        if (!page.is_object() || !page.contains("ids") || !page["ids"].is_array()) {
            throw ApiError("unexpected response shape from " + endpoint);
        }

        for (const auto& id : page["ids"]) {
            if (id.is_number_integer()) sink(id.get<int64_t>());
        }

        if (!page.contains("next_cursor") || !page["next_cursor"].is_number_integer()) break;
        cursor = page["next_cursor"].get<int64_t>();
    }
}

void RestClient::follower_ids(const UserRef& user, const IdSink& sink) {
    cursored_ids("followers/ids.json", user, sink);
}

void RestClient::friend_ids(const UserRef& user, const IdSink& sink) {
    cursored_ids("friends/ids.json", user, sink);
}

std::vector<json> RestClient::lookup_users(const std::vector<std::string>& user_ids,
                                           const std::vector<std::string>& screen_names) {
    Params params;
    if (!user_ids.empty()) params.emplace_back("user_id", join(user_ids, ','));
    if (!screen_names.empty()) params.emplace_back("screen_name", join(screen_names, ','));
    if (params.empty()) return {};

    const json page = get_json("users/lookup.json", params);
    if (!page.is_array()) throw ApiError("unexpected response shape from users/lookup.json");

    return std::vector<json>(page.begin(), page.end());
}

} // namespace api
