#include "commands/users.hpp"
#include "commands/CommandUtil.hpp"

#include "bulk/Chunker.hpp"
#include "io/IdentityList.hpp"
#include "io/JsonIO.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static int users_usage() {
    std::cerr
        << "usage:\n"
        << "  twtoolbox users [--ids <file>] [--names <file>] [--out <path>] [--chunk <n>]\n";
    return 2;
}

int cmd_users(int argc, char** argv) {
    const std::string ids_path    = get_arg(argc, argv, "--ids", "");
    const std::string names_path  = get_arg(argc, argv, "--names", "");
    const std::string out_path    = get_arg(argc, argv, "--out", "");
    const std::string chunk_arg   = get_arg(argc, argv, "--chunk", "");
    const std::string config_path = get_arg(argc, argv, "--config", "");
    const std::string mock_dir    = get_arg(argc, argv, "--mock", "");

    if (ids_path.empty() && names_path.empty()) {
        std::cerr << "error: at least --ids or --names must be provided\n";
        return users_usage();
    }

    std::vector<std::string> ids;
    std::vector<std::string> names;
    CommandContext ctx;
    int chunk_size = 0;
    try {
        std::vector<int64_t> raw_ids;
        if (!ids_path.empty()) raw_ids = io::read_user_ids(ids_path);
        if (!names_path.empty()) names = io::read_lines(names_path);
        io::ensure_at_least_one(raw_ids, names);
        for (int64_t id : raw_ids) ids.push_back(std::to_string(id));

        ctx = make_context("users", config_path, mock_dir);
        chunk_size = chunk_arg.empty() ? ctx.config.bulk.chunk_size : parse_int_arg("--chunk", chunk_arg);
        if (chunk_size <= 0) throw io::ConfigError("--chunk must be positive");
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    std::ofstream file;
    if (!out_path.empty()) {
        file.open(out_path, std::ios::out | std::ios::trunc);
        if (!file) {
            ctx.log->error("failed to open output file: " + out_path);
            return 1;
        }
    }
    std::ostream& out = out_path.empty() ? std::cout : file;

    auto chunks = bulk::gen_chunks<std::string>({std::move(ids), std::move(names)}, chunk_size);

    size_t found = 0;
    size_t failed_chunks = 0;
    bulk::Chunk<std::string> chunk;
    while (chunks.next(chunk)) {
        ctx.log->info("looking up " + std::to_string(chunk[0].size()) + " ids and " +
                      std::to_string(chunk[1].size()) + " screen names");
        try {
            for (const auto& user : ctx.client->lookup_users(chunk[0], chunk[1])) {
                io::write_json_line(out, user);
                ++found;
            }
        } catch (const api::ApiError& e) {
            ctx.log->error("exception while using the REST API", e);
            ++failed_chunks;
        }
    }

    out.flush();
    if (!out) {
        ctx.log->error("failed to write users output");
        return 1;
    }

    ctx.log->info("users found: " + std::to_string(found));
    if (failed_chunks) ctx.log->warning("failed lookups: " + std::to_string(failed_chunks));
    return 0;
}
