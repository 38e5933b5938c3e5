#include "io/IdentityList.hpp"
#include "io/Config.hpp"
#include "io/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

static std::vector<std::pair<size_t, std::string>> read_numbered_lines(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open identity list: " + path.string());

    std::vector<std::pair<size_t, std::string>> out;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        out.emplace_back(line_no, std::move(t));
    }
    return out;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> out;
    for (auto& nl : read_numbered_lines(path)) out.push_back(std::move(nl.second));
    return out;
}

std::vector<int64_t> read_user_ids(const fs::path& path) {
    std::vector<int64_t> out;
    for (const auto& nl : read_numbered_lines(path)) {
        size_t used = 0;
        int64_t v = 0;
        try {
            v = std::stoll(nl.second, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != nl.second.size()) {
            throw ConfigError(path.string() + ":" + std::to_string(nl.first) + ": not a user id: " + nl.second);
        }
        out.push_back(v);
    }
    return out;
}

void ensure_at_least_one(const std::vector<int64_t>& user_ids, const std::vector<std::string>& screen_names) {
    if (user_ids.empty() && screen_names.empty()) {
        throw ConfigError("at least user_ids or screen_names must be provided");
    }
}

api::UserRef ensure_only_one(const std::optional<int64_t>& user_id, const std::optional<std::string>& screen_name) {
    if (user_id.has_value() == screen_name.has_value()) {
        throw ConfigError("only user_id or screen_name must be provided");
    }
    return user_id ? api::UserRef::by_id(*user_id) : api::UserRef::by_name(*screen_name);
}

std::vector<bulk::WorkItem> make_work_items(const std::vector<int64_t>& user_ids,
                                            const std::vector<std::string>& screen_names) {
    std::vector<bulk::WorkItem> items;
    items.reserve(user_ids.size() + screen_names.size());

    for (int64_t id : user_ids) {
        api::UserRef ref = api::UserRef::by_id(id);
        items.push_back(bulk::WorkItem{ref.value, ref});
    }
    for (const auto& name : screen_names) {
        items.push_back(bulk::WorkItem{name, api::UserRef::by_name(name)});
    }
    return items;
}

} // namespace io
