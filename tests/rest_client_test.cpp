#include <gtest/gtest.h>
#include "api/RestClient.hpp"
#include "TestUtil.hpp"

namespace fs = std::filesystem;
using testutil::read_file;
using testutil::read_file_lines;
using testutil::write_file;

// Stands in for curl: answers the n-th request with status<n>/body<n> (falling back to
// status/body), and records every requested URL.
class RestClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.path();
        fake_curl_ = root_ / "fake_curl.sh";

        const std::string r = root_.string();
        write_file(fake_curl_,
            "#!/bin/sh\n"
            "url=''\n"
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -o) body=\"$2\"; shift 2;;\n"
            "    -D) hdr=\"$2\"; shift 2;;\n"
            "    -H|-w|--max-time|--data-binary) shift 2;;\n"
            "    -s) shift;;\n"
            "    *) url=\"$1\"; shift;;\n"
            "  esac\n"
            "done\n"
            "n=$(cat '" + r + "/counter' 2>/dev/null || echo 0)\n"
            "n=$((n+1))\n"
            "echo $n > '" + r + "/counter'\n"
            "echo \"$url\" >> '" + r + "/urls.log'\n"
            "s='" + r + "/status'; [ -f \"$s$n\" ] && s=\"$s$n\"\n"
            "b='" + r + "/body'; [ -f \"$b$n\" ] && b=\"$b$n\"\n"
            "status=$(cat \"$s\")\n"
            "printf 'HTTP/1.1 %s\\r\\nx-rate-limit-reset: 0\\r\\n\\r\\n' \"$status\" > \"$hdr\"\n"
            "cp \"$b\" \"$body\"\n"
            "printf '%s' \"$status\"\n");
        fs::permissions(fake_curl_, fs::perms::owner_all);

        opts_.api_base = "https://api.example.test/1.1";
        opts_.token_url = "https://api.example.test/oauth2/token";
        opts_.bearer_token = "tok";
        opts_.curl = fake_curl_.string();
        opts_.scratch_dir = root_ / "scratch";
        opts_.max_retries = 0;
    }

    void respond(const std::string& status, const std::string& body, const std::string& suffix = "") {
        write_file(root_ / ("status" + suffix), status);
        write_file(root_ / ("body" + suffix), body);
    }

    std::vector<std::string> urls() const { return read_file_lines(root_ / "urls.log"); }

    testutil::ScratchDir dir_;
    testutil::RecordingLogger log_;
    fs::path root_;
    fs::path fake_curl_;
    api::RestOptions opts_;
};

TEST_F(RestClientTest, LookupSendsBothIdentityKinds) {
    respond("200", R"([{"id":1,"screen_name":"a"},{"id":2,"screen_name":"b"}])");

    api::RestClient client(opts_, log_);
    auto users = client.lookup_users({"1", "2"}, {"alice"});

    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[1]["screen_name"], "b");

    ASSERT_EQ(urls().size(), 1u);
    EXPECT_EQ(urls()[0], "https://api.example.test/1.1/users/lookup.json?user_id=1%2C2&screen_name=alice");
    EXPECT_NE(read_file(opts_.scratch_dir / "request_headers.txt").find("Authorization: Bearer tok"),
              std::string::npos);
}

TEST_F(RestClientTest, TimelinePagesDownwardWithMaxId) {
    respond("200", "[]");
    respond("200", R"([{"id":30},{"id":20}])", "1");

    api::RestClient client(opts_, log_);
    std::vector<int64_t> ids;
    client.user_timeline(api::UserRef::by_name("alice"), int64_t(7),
                         [&](const nlohmann::json& t) { ids.push_back(t["id"].get<int64_t>()); });

    EXPECT_EQ(ids, (std::vector<int64_t>{30, 20}));
    auto u = urls();
    ASSERT_EQ(u.size(), 2u);
    EXPECT_NE(u[0].find("screen_name=alice"), std::string::npos);
    EXPECT_NE(u[0].find("since_id=7"), std::string::npos);
    EXPECT_EQ(u[0].find("max_id"), std::string::npos);
    EXPECT_NE(u[1].find("max_id=19"), std::string::npos);
}

TEST_F(RestClientTest, IdListsFollowCursors) {
    respond("200", R"({"ids":[3],"next_cursor":0})");
    respond("200", R"({"ids":[1,2],"next_cursor":1234})", "1");

    api::RestClient client(opts_, log_);
    std::vector<int64_t> ids;
    client.follower_ids(api::UserRef::by_id(99), [&](int64_t id) { ids.push_back(id); });

    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2, 3}));
    auto u = urls();
    ASSERT_EQ(u.size(), 2u);
    EXPECT_NE(u[0].find("followers/ids.json?user_id=99"), std::string::npos);
    EXPECT_NE(u[0].find("cursor=-1"), std::string::npos);
    EXPECT_NE(u[1].find("cursor=1234"), std::string::npos);
}

TEST_F(RestClientTest, ApiErrorsCarryStatusAndCode) {
    respond("404", R"({"errors":[{"code":50,"message":"User not found."}]})");

    api::RestClient client(opts_, log_);
    try {
        client.friend_ids(api::UserRef::by_name("ghost"), [](int64_t) {});
        FAIL() << "expected ApiError";
    } catch (const api::ApiError& e) {
        EXPECT_EQ(e.http_status(), 404);
        EXPECT_EQ(e.api_code(), 50);
        EXPECT_NE(std::string(e.what()).find("User not found."), std::string::npos);
    }
}

TEST_F(RestClientTest, RateLimitRetriesThenGivesUp) {
    respond("429", R"({"errors":[{"code":88,"message":"Rate limit exceeded"}]})");
    opts_.max_retries = 1;

    api::RestClient client(opts_, log_);
    EXPECT_THROW(client.lookup_users({"1"}, {}), api::ApiError);
    EXPECT_EQ(urls().size(), 2u);
    EXPECT_TRUE(log_.contains(logging::Level::warning, "rate limit reached"));
}

TEST_F(RestClientTest, ApplicationAuthFetchesBearerToken) {
    opts_.bearer_token.clear();
    opts_.consumer_key = "key";
    opts_.consumer_secret = "secret";
    respond("200", R"({"token_type":"bearer","access_token":"fresh"})", "1");
    respond("200", R"([])");

    api::RestClient client(opts_, log_);
    client.lookup_users({"1"}, {});

    auto u = urls();
    ASSERT_EQ(u.size(), 2u);
    EXPECT_EQ(u[0], opts_.token_url);
    EXPECT_NE(read_file(opts_.scratch_dir / "request_headers.txt").find("Authorization: Bearer fresh"),
              std::string::npos);
}

TEST_F(RestClientTest, MissingCredentialsIsAnApiError) {
    opts_.bearer_token.clear();
    api::RestClient client(opts_, log_);
    EXPECT_THROW(client.lookup_users({"1"}, {}), api::ApiError);
}

TEST(RestEncodingTest, UrlEncode) {
    EXPECT_EQ(api::url_encode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(api::url_encode("a b,c"), "a%20b%2Cc");
    EXPECT_EQ(api::url_encode("\xC3\xA9"), "%C3%A9");
}

TEST(RestEncodingTest, Base64) {
    EXPECT_EQ(api::base64_encode(""), "");
    EXPECT_EQ(api::base64_encode("f"), "Zg==");
    EXPECT_EQ(api::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(api::base64_encode("foo"), "Zm9v");
    EXPECT_EQ(api::base64_encode("key:secret"), "a2V5OnNlY3JldA==");
}

TEST_F(RestClientTest, DefaultScratchDirIsPrivateAndRemoved) {
    respond("200", "[]");
    opts_.scratch_dir.clear();

    fs::path scratch;
    {
        api::RestClient client(opts_, log_);
        scratch = client.scratch_dir();
        client.lookup_users({"1"}, {});

        ASSERT_TRUE(fs::is_directory(scratch));
        EXPECT_EQ(fs::status(scratch).permissions() & (fs::perms::group_all | fs::perms::others_all),
                  fs::perms::none);
        EXPECT_EQ(fs::status(scratch / "request_headers.txt").permissions(),
                  fs::perms::owner_read | fs::perms::owner_write);
    }
    EXPECT_FALSE(fs::exists(scratch));
}

TEST_F(RestClientTest, CallerScratchDirIsKept) {
    respond("200", "[]");
    {
        api::RestClient client(opts_, log_);
        client.lookup_users({"1"}, {});
    }
    EXPECT_TRUE(fs::exists(opts_.scratch_dir / "request_headers.txt"));
}

TEST_F(RestClientTest, LocalScratchFailureIsNotARemoteError) {
    respond("200", "[]");
    fs::create_directories(opts_.scratch_dir / "request_headers.txt");

    api::RestClient client(opts_, log_);
    try {
        client.lookup_users({"1"}, {});
        FAIL() << "expected std::runtime_error";
    } catch (const api::ApiError& e) {
        FAIL() << "local write failure reported as ApiError: " << e.what();
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("request_headers.txt"), std::string::npos);
    }
    EXPECT_TRUE(urls().empty());
}
