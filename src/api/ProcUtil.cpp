#include "api/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

std::string shell_quote(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 2);
    o.push_back('\'');
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o.push_back(c);
    }
    o.push_back('\'');
    return o;
}

std::string run_capture_stdout(const std::string& cmdline, int& exit_code) {
    exit_code = -1;

    FILE* pipe = ::popen(cmdline.c_str(), "r");
    if (!pipe) return "";

    std::string out;
    out.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, buf + n);
    }

    const int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status)) exit_code = WEXITSTATUS(status);

    return out;
}

} // namespace procutil
