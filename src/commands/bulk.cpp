#include "commands/bulk.hpp"
#include "commands/CommandUtil.hpp"

#include "bulk/BulkRunner.hpp"
#include "io/IdentityList.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class BulkKind { timelines, followers, friends };

static const char* kind_name(BulkKind k) {
    switch (k) {
        case BulkKind::timelines: return "timelines";
        case BulkKind::followers: return "followers";
        case BulkKind::friends:   return "friends";
    }
    return "";
}

static int bulk_usage(BulkKind k) {
    std::cerr
        << "usage:\n"
        << "  twtoolbox " << kind_name(k) << " (--ids <file> | --names <file>) [options]\n";
    return 2;
}

struct BulkArgs {
    std::string ids_path;
    std::string names_path;
    std::string outdir;
    std::string config_path;
    std::string mock_dir;
    bool resume = false;
};

// 0 on success, otherwise the exit code to return
static int parse_bulk_args(BulkKind k, int argc, char** argv, BulkArgs& out) {
    out.outdir = kind_name(k);

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--resume") {
            out.resume = true;
            continue;
        }

        std::string* target = nullptr;
        if (a == "--ids") target = &out.ids_path;
        else if (a == "--names") target = &out.names_path;
        else if (a == "--outdir") target = &out.outdir;
        else if (a == "--config") target = &out.config_path;
        else if (a == "--mock") target = &out.mock_dir;

        if (!target) {
            std::cerr << "error: unknown arg: " << a << "\n";
            return bulk_usage(k);
        }
        if (i + 1 >= argc) {
            std::cerr << "error: " << a << " requires a value\n";
            return 2;
        }
        *target = argv[++i];
    }

    if (out.resume && k != BulkKind::timelines) {
        std::cerr << "error: --resume is only supported by timelines\n";
        return 2;
    }
    return 0;
}

static bulk::WorkFn make_work_fn(BulkKind k, api::Client& client) {
    switch (k) {
        case BulkKind::timelines:
            return [&client](std::ostream& out, const bulk::WorkArgs& args) {
                client.user_timeline(args.user, args.since_id,
                                     [&out](const nlohmann::json& tweet) { io::write_json_line(out, tweet); });
            };
        case BulkKind::followers:
            return [&client](std::ostream& out, const bulk::WorkArgs& args) {
                client.follower_ids(args.user, [&out](int64_t id) { out << id << "\n"; });
            };
        case BulkKind::friends:
            return [&client](std::ostream& out, const bulk::WorkArgs& args) {
                client.friend_ids(args.user, [&out](int64_t id) { out << id << "\n"; });
            };
    }
    return {};
}

static int run_bulk(BulkKind k, int argc, char** argv) {
    BulkArgs args;
    if (int rc = parse_bulk_args(k, argc, argv, args)) return rc;

    std::vector<bulk::WorkItem> items;
    CommandContext ctx;
    try {
        std::vector<int64_t> ids;
        std::vector<std::string> names;
        if (!args.ids_path.empty()) ids = io::read_user_ids(args.ids_path);
        if (!args.names_path.empty()) names = io::read_lines(args.names_path);
        io::ensure_at_least_one(ids, names);
        items = io::make_work_items(ids, names);

        ctx = make_context(kind_name(k), args.config_path, args.mock_dir);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    const std::string tmpl = (k == BulkKind::timelines) ? "%s.json" : "%s.txt";

    bulk::BulkRunner runner(*ctx.log);
    bulk::RunResult res;
    try {
        res = runner.run(fs::path(args.outdir), tmpl, make_work_fn(k, *ctx.client), items, args.resume);
    } catch (const std::exception& e) {
        ctx.log->error("run aborted", e);
        return 1;
    }

    std::cout << "processed: " << res.processed << "/" << items.size() << "\n";
    if (res.skipped) std::cout << "skipped: " << res.skipped << "\n";
    if (res.failed) std::cout << "failed: " << res.failed << "\n";
    return 0;
}

int cmd_timelines(int argc, char** argv) { return run_bulk(BulkKind::timelines, argc, argv); }
int cmd_followers(int argc, char** argv) { return run_bulk(BulkKind::followers, argc, argv); }
int cmd_friends(int argc, char** argv) { return run_bulk(BulkKind::friends, argc, argv); }
