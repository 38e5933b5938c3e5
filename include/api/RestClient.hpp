#pragma once

#include "api/Client.hpp"
#include "io/Config.hpp"
#include "log/Logger.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace api {

struct RestOptions {
    std::string api_base = "https://api.twitter.com/1.1";
    std::string token_url = "https://api.twitter.com/oauth2/token";
    std::string bearer_token;
    std::string consumer_key;
    std::string consumer_secret;
    int timeout_s = 30;

    bool wait_on_rate_limit = true;
    int max_retries = 3;
    int fallback_wait_s = 900;

    int timeline_page_size = 200;
    int ids_page_size = 5000;

    std::string curl = "curl";
    std::filesystem::path scratch_dir; // request/response files; private temp dir when empty

    static RestOptions from_config(const io::Config& cfg);
};

// REST v1.1 with application-only auth, one curl child process per request.
class RestClient final : public Client {
    RestOptions opts_;
    logging::Logger& log_;
    std::string token_;
    bool owns_scratch_ = false;

public:
    RestClient(RestOptions opts, logging::Logger& log);
    ~RestClient() override;

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    // removed on destruction only when the client picked it itself
    const std::filesystem::path& scratch_dir() const { return opts_.scratch_dir; }

    void user_timeline(const UserRef& user, std::optional<int64_t> since_id, const RecordSink& sink) override;
    void follower_ids(const UserRef& user, const IdSink& sink) override;
    void friend_ids(const UserRef& user, const IdSink& sink) override;
    std::vector<nlohmann::json> lookup_users(const std::vector<std::string>& user_ids,
                                             const std::vector<std::string>& screen_names) override;

private:
    using Params = std::vector<std::pair<std::string, std::string>>;

    struct HttpResponse {
        int status = 0;
        std::map<std::string, std::string> headers; // lowercase names
        std::string body;
    };

    HttpResponse run_curl(const std::string& url, const std::string& auth_header, const std::string& post_data);
    nlohmann::json get_json(const std::string& endpoint, const Params& params);
    const std::string& bearer();
    void cursored_ids(const std::string& endpoint, const UserRef& user, const IdSink& sink);

    int seconds_until_reset(const HttpResponse& r) const;
};

std::string url_encode(const std::string& s);
std::string base64_encode(const std::string& s);

} // namespace api
