#pragma once
#include <string>
#include <vector>

namespace wifiproxy {

struct CmdResult {
    int code = 0;       // exit status; 124 on timeout, 127 when the program could not be executed
    std::string out;
    std::string err;
};

// Runs argv[0] (PATH lookup) with a C locale, capturing stdout/stderr.
// The child's process group is killed when timeoutMs elapses.
CmdResult runCommandWithTimeout(const std::vector<std::string> &argv, int timeoutMs);

} // namespace wifiproxy
