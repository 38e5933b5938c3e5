#pragma once
#include "nlohmann/json.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace api {

// Raised for every remote-side failure: auth, not found, rate limit after retries, transport.
class ApiError : public std::runtime_error {
    int http_status_;
    int api_code_;

public:
    explicit ApiError(const std::string& msg, int http_status = 0, int api_code = 0)
        : std::runtime_error(msg), http_status_(http_status), api_code_(api_code) {}

    int http_status() const { return http_status_; }
    int api_code() const { return api_code_; }
};

enum class UserKey { user_id, screen_name };

struct UserRef {
    UserKey key = UserKey::screen_name;
    std::string value; // decimal string for user_id

    static UserRef by_id(int64_t id) { return UserRef{UserKey::user_id, std::to_string(id)}; }
    static UserRef by_name(const std::string& name) { return UserRef{UserKey::screen_name, name}; }

    const char* param_name() const { return key == UserKey::user_id ? "user_id" : "screen_name"; }
};

using RecordSink = std::function<void(const nlohmann::json&)>;
using IdSink = std::function<void(int64_t)>;

class Client {
public:
    virtual ~Client() = default;

    // newest first; only tweets with id > since_id when since_id is set
    virtual void user_timeline(const UserRef& user, std::optional<int64_t> since_id, const RecordSink& sink) = 0;

    virtual void follower_ids(const UserRef& user, const IdSink& sink) = 0;
    virtual void friend_ids(const UserRef& user, const IdSink& sink) = 0;

    // one lookup call; the caller keeps the combined size within the API's per-call limit
    virtual std::vector<nlohmann::json> lookup_users(const std::vector<std::string>& user_ids,
                                                     const std::vector<std::string>& screen_names) = 0;
};

} // namespace api
