#include "bulk/Checkpoint.hpp"
#include "io/JsonIO.hpp"

#include "nlohmann/json.hpp"

#include <limits>

using json = nlohmann::json;

namespace bulk {

std::optional<int64_t> latest_id(const std::filesystem::path& path) {
    std::optional<int64_t> latest;

    io::for_each_line(path, [&](size_t line_no, const std::string& line) {
        json obj;
        try {
            obj = json::parse(line);
        } catch (const json::parse_error& e) {
            throw MalformedRecordError(path.string(), line_no, std::string("invalid JSON: ") + e.what());
        }

        if (!obj.is_object()) throw MalformedRecordError(path.string(), line_no, "record is not an object");
        if (!obj.contains("id")) throw MalformedRecordError(path.string(), line_no, "record has no id");
        if (!obj["id"].is_number_integer()) throw MalformedRecordError(path.string(), line_no, "id is not an integer");
        if (obj["id"].is_number_unsigned() &&
            obj["id"].get<uint64_t>() > (uint64_t)std::numeric_limits<int64_t>::max()) {
            throw MalformedRecordError(path.string(), line_no, "id out of range");
        }

        const int64_t id = obj["id"].get<int64_t>();
        if (!latest || id > *latest) latest = id;
    });

    return latest;
}

} // namespace bulk
