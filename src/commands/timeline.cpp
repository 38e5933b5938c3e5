#include "commands/timeline.hpp"
#include "commands/CommandUtil.hpp"

#include "io/IdentityList.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <optional>
#include <string>

static int timeline_usage() {
    std::cerr
        << "usage:\n"
        << "  twtoolbox timeline (--id <user id> | --name <screen name>) [--since_id <id>]\n";
    return 2;
}

int cmd_timeline(int argc, char** argv) {
    const std::string id_arg      = get_arg(argc, argv, "--id", "");
    const std::string name_arg    = get_arg(argc, argv, "--name", "");
    const std::string since_arg   = get_arg(argc, argv, "--since_id", "");
    const std::string config_path = get_arg(argc, argv, "--config", "");
    const std::string mock_dir    = get_arg(argc, argv, "--mock", "");

    api::UserRef user;
    std::optional<int64_t> since_id;
    CommandContext ctx;
    try {
        std::optional<int64_t> user_id;
        std::optional<std::string> screen_name;
        if (!id_arg.empty()) user_id = parse_int64_arg("--id", id_arg);
        if (!name_arg.empty()) screen_name = name_arg;
        user = io::ensure_only_one(user_id, screen_name);

        if (!since_arg.empty()) since_id = parse_int64_arg("--since_id", since_arg);

        ctx = make_context("timeline", config_path, mock_dir);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return timeline_usage();
    }

    size_t n = 0;
    try {
        ctx.client->user_timeline(user, since_id, [&](const nlohmann::json& tweet) {
            io::write_json_line(std::cout, tweet);
            ++n;
        });
    } catch (const api::ApiError& e) {
        ctx.log->error("exception while using the REST API", e);
        return 1;
    }

    ctx.log->info("tweets written: " + std::to_string(n));
    return 0;
}
