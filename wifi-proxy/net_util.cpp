#include "net_util.h"
#include "errors.h"

#include <sys/stat.h>
#include <limits.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace wifiproxy {

std::string getExecutableDir() {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    buf[n] = '\0';
    char *slash = strrchr(buf, '/');
    if (!slash) return ".";
    *slash = '\0';
    return std::string(buf);
}

bool readFileToString(const std::string &path, std::string &out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;

    struct stat st;
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return false;
    }

    out.clear();
    if (st.st_size > 0) out.reserve(static_cast<size_t>(st.st_size));

    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, buf + n);
        } else if (n == 0) {
            break; // EOF
        } else {
            if (errno == EINTR) continue;
            ::close(fd);
            return false;
        }
    }

    ::close(fd);
    return true;
}

int computeBackoffMs(int base, int max, int attempt) {
    int expo = base;
    for (int i = 0; i < attempt; ++i) {
        if (expo >= max) { expo = max; break; }
        if (expo > max / 2) { expo = max; break; }
        expo <<= 1;
    }
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> jitter(0, std::max(0, base - 1));
    int delay = std::min(max, expo) + jitter(rng);
    return delay;
}

std::string envStr(const char *name, const char *defv) {
    const char *p = std::getenv(name);
    return p ? std::string(p) : std::string(defv);
}

int envInt(const char *name, int defv) {
    const char *p = std::getenv(name);
    if (!p || !*p) return defv;
    char *end = nullptr;
    errno = 0;
    long v = std::strtol(p, &end, 10);
    if (errno != 0 || end == p || *end != '\0' || v < INT_MIN || v > INT_MAX) {
        throw ConfigError(std::string(name) + ": expected an integer, got '" + p + "'");
    }
    return (int)v;
}

std::string trim(const std::string &s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> split(const std::string &s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) { out.push_back(s.substr(start)); break; }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string toLower(std::string s) {
    for (auto &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool startsWith(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace wifiproxy
