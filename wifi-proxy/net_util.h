#pragma once
#include <string>
#include <vector>

namespace wifiproxy {

// --------------- Linux helpers ---------------
// Resolve the directory of the running executable (Linux: /proc/self/exe)
std::string getExecutableDir();

// Read an entire small file into a std::string (binary-safe)
bool readFileToString(const std::string &path, std::string &out);

int computeBackoffMs(int base, int max, int attempt);

// --------------- Config from ENV ---------------
std::string envStr(const char *name, const char *defv);
// Throws ConfigError when the variable is set but is not an integer
int envInt(const char *name, int defv);

// --------------- strings ---------------
std::string trim(const std::string &s);
std::vector<std::string> split(const std::string &s, char sep);
std::string toLower(std::string s);
bool startsWith(const std::string &s, const std::string &prefix);

} // namespace wifiproxy
