#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace io {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto a = s.find_first_not_of(ws);
    if (a == std::string::npos) return "";
    const auto b = s.find_last_not_of(ws);
    return s.substr(a, b - a + 1);
}

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }
    json j;
    in >> j;
    return j;
}

void write_json_line(std::ostream& out, const json& j) {
    out << j.dump() << "\n";
}

void for_each_line(const fs::path& path, const std::function<void(size_t, const std::string&)>& fn) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open: " + path.string());
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        fn(line_no, line);
    }
    if (in.bad()) {
        throw std::runtime_error("read error: " + path.string());
    }
}

std::vector<json> read_json_lines(const fs::path& path) {
    std::vector<json> out;
    for_each_line(path, [&](size_t line_no, const std::string& line) {
        try {
            out.push_back(json::parse(line));
        } catch (const json::parse_error& e) {
            std::ostringstream oss;
            oss << path.string() << ":" << line_no << ": " << e.what();
            throw std::runtime_error(oss.str());
        }
    });
    return out;
}

} // namespace io
