#pragma once
#include <string>

namespace procutil {

// Runs a command line through /bin/sh and returns captured stdout.
// exit_code receives the child's exit status, or -1 if it could not be started.
std::string run_capture_stdout(const std::string& cmdline, int& exit_code);

// single-quoted for /bin/sh
std::string shell_quote(const std::string& s);

} // namespace procutil
