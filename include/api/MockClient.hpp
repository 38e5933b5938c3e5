#pragma once

#include "api/Client.hpp"

#include <filesystem>
#include <string>

namespace api {

// Serves canned responses from a directory tree:
//   timelines/<value>.jsonl  followers/<value>.txt  friends/<value>.txt  users/<value>.json
class MockClient final : public Client {
    std::filesystem::path root_;

public:
    explicit MockClient(const std::string& root_dir);

    void user_timeline(const UserRef& user, std::optional<int64_t> since_id, const RecordSink& sink) override;
    void follower_ids(const UserRef& user, const IdSink& sink) override;
    void friend_ids(const UserRef& user, const IdSink& sink) override;
    std::vector<nlohmann::json> lookup_users(const std::vector<std::string>& user_ids,
                                             const std::vector<std::string>& screen_names) override;

private:
    std::filesystem::path fixture(const std::string& kind, const std::string& value, const std::string& ext) const;
    void load_ids(const std::string& kind, const UserRef& user, const IdSink& sink) const;
};

} // namespace api
