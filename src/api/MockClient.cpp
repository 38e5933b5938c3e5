#include "api/MockClient.hpp"
#include "io/JsonIO.hpp"

#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace api {

MockClient::MockClient(const std::string& root_dir) : root_(root_dir) {}

fs::path MockClient::fixture(const std::string& kind, const std::string& value, const std::string& ext) const {
    fs::path p = root_ / kind / (value + ext);
    if (!fs::exists(p)) {
        throw ApiError("not found: " + kind + "/" + value, 404, 34);
    }
    return p;
}

void MockClient::user_timeline(const UserRef& user, std::optional<int64_t> since_id, const RecordSink& sink) {
    const fs::path p = fixture("timelines", user.value, ".jsonl");

    std::vector<json> tweets;
    try {
        tweets = io::read_json_lines(p);
    } catch (const std::runtime_error& e) {
        throw ApiError(std::string("malformed response: ") + e.what(), 500);
    }

    for (const auto& t : tweets) {
        if (!t.is_object() || !t.contains("id") || !t["id"].is_number_integer()) continue;
        if (since_id && t["id"].get<int64_t>() <= *since_id) continue;
        sink(t);
    }
}

void MockClient::load_ids(const std::string& kind, const UserRef& user, const IdSink& sink) const {
    const fs::path p = fixture(kind, user.value, ".txt");
    io::for_each_line(p, [&](size_t line_no, const std::string& line) {
        int64_t id = 0;
        try {
            id = std::stoll(io::trim(line));
        } catch (const std::logic_error&) {
            throw ApiError("malformed id at " + p.string() + ":" + std::to_string(line_no), 500);
        }
        sink(id);
    });
}

void MockClient::follower_ids(const UserRef& user, const IdSink& sink) {
    load_ids("followers", user, sink);
}

void MockClient::friend_ids(const UserRef& user, const IdSink& sink) {
    load_ids("friends", user, sink);
}

std::vector<json> MockClient::lookup_users(const std::vector<std::string>& user_ids,
                                           const std::vector<std::string>& screen_names) {
    std::vector<json> out;

    // unknown users are dropped, like the real lookup endpoint
    auto add = [&](const std::string& value) {
        fs::path p = root_ / "users" / (value + ".json");
        if (!fs::exists(p)) return;
        out.push_back(io::read_json_file(p));
    };

    for (const auto& id : user_ids) add(id);
    for (const auto& name : screen_names) add(name);

    if (out.empty() && (!user_ids.empty() || !screen_names.empty())) {
        throw ApiError("no user matches for specified terms", 404, 17);
    }
    return out;
}

} // namespace api
