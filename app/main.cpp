#include "commands/bulk.hpp"
#include "commands/timeline.hpp"
#include "commands/users.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  twtoolbox timelines [args]\n"
        << "  twtoolbox followers [args]\n"
        << "  twtoolbox friends [args]\n"
        << "  twtoolbox users [args]\n"
        << "  twtoolbox timeline [args]\n"
        << "  twtoolbox help\n";
    return 1;
}

static int print_bulk_help(const std::string& cmd) {
    std::cerr
        << "usage:\n"
        << "  twtoolbox " << cmd << " (--ids <file> | --names <file>) [options]\n"
        << "\n"
        << "identities (one per line, '#' starts a comment):\n"
        << "  --ids <file>                 numeric user ids\n"
        << "  --names <file>               screen names\n"
        << "\n"
        << "output:\n"
        << "  --outdir <dir>               default: " << cmd << "\n";
    if (cmd == "timelines") {
        std::cerr
            << "  --resume                     append to existing files, fetching only newer tweets\n";
    }
    std::cerr
        << "\n"
        << "common:\n"
        << "  --config <path>              overlay on defaults and ~/.twtoolbox.json\n"
        << "  --mock <dir>                 serve responses from dir instead of the REST API\n";
    return 0;
}

static int print_users_help() {
    std::cerr
        << "usage:\n"
        << "  twtoolbox users [--ids <file>] [--names <file>] [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: stdout\n"
        << "  --chunk <n>                  users per lookup, default: bulk.chunk_size (100)\n"
        << "  --config <path>\n"
        << "  --mock <dir>\n";
    return 0;
}

static int print_timeline_help() {
    std::cerr
        << "usage:\n"
        << "  twtoolbox timeline (--id <user id> | --name <screen name>) [options]\n"
        << "\n"
        << "options:\n"
        << "  --since_id <id>              only tweets newer than id\n"
        << "  --config <path>\n"
        << "  --mock <dir>\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    const bool want_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (want_help) {
        if (cmd == "timelines" || cmd == "followers" || cmd == "friends") return print_bulk_help(cmd);
        if (cmd == "users") return print_users_help();
        if (cmd == "timeline") return print_timeline_help();
    }

    if (cmd == "timelines") return cmd_timelines(argc - 1, argv + 1);
    if (cmd == "followers") return cmd_followers(argc - 1, argv + 1);
    if (cmd == "friends")   return cmd_friends(argc - 1, argv + 1);
    if (cmd == "users")     return cmd_users(argc - 1, argv + 1);
    if (cmd == "timeline")  return cmd_timeline(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
