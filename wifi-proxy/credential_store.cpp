#include "credential_store.h"
#include "errors.h"
#include "net_util.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace wifiproxy {

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

std::string CredentialStore::defaultPath() {
    std::string over = envStr("WIFI_PROXY_CONFIG", "");
    if (!over.empty()) return over;
    std::string xdg = envStr("XDG_CONFIG_HOME", "");
    if (!xdg.empty()) return xdg + "/wifi-proxy/config.json";
    std::string home = envStr("HOME", "");
    if (home.empty()) throw ConfigError("cannot locate config: neither HOME nor XDG_CONFIG_HOME is set");
    return home + "/.config/wifi-proxy/config.json";
}

void CredentialStore::load() {
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            std::lock_guard<std::mutex> lk(mtx_);
            defaultInterface_.reset();
            networks_.clear();
            return;
        }
        throw ConfigError(path_ + ": " + strerror(errno));
    }

    std::string text;
    if (!readFileToString(path_, text)) throw ConfigError(path_ + ": cannot read file");

    std::optional<std::string> defIface;
    std::vector<NetworkCredential> nets;
    try {
        json j = json::parse(text);
        if (!j.is_object()) throw ConfigError(path_ + ": top level must be an object");
        if (j.contains("default_interface") && !j["default_interface"].is_null()) {
            std::string d = j["default_interface"].get<std::string>();
            if (!d.empty()) defIface = d;
        }
        if (j.contains("networks")) {
            if (!j["networks"].is_array()) throw ConfigError(path_ + ": 'networks' must be an array");
            for (auto &n : j["networks"]) {
                if (!n.is_object() || !n.contains("ssid") || !n["ssid"].is_string()) {
                    throw ConfigError(path_ + ": every network needs a string 'ssid'");
                }
                NetworkCredential c;
                c.ssid = n["ssid"].get<std::string>();
                c.password = n.value("password", "");
                c.interfaceName = n.contains("interface") && n["interface"].is_string()
                    ? n["interface"].get<std::string>() : std::string();
                nets.push_back(std::move(c));
            }
        }
    } catch (const json::exception &e) {
        throw ConfigError(path_ + ": " + e.what());
    }

    std::lock_guard<std::mutex> lk(mtx_);
    defaultInterface_ = std::move(defIface);
    networks_.clear();
    // Later duplicates win, like repeated put()
    for (auto &c : nets) {
        bool replaced = false;
        for (auto &e : networks_) {
            if (e.ssid == c.ssid && e.interfaceName == c.interfaceName) { e = c; replaced = true; break; }
        }
        if (!replaced) networks_.push_back(std::move(c));
    }
}

static void makeDirs(const std::string &dir) {
    if (dir.empty()) return;
    std::string cur;
    for (auto &part : split(dir, '/')) {
        cur += part;
        cur += '/';
        if (part.empty() || part == ".") continue;
        if (::mkdir(cur.c_str(), 0700) != 0 && errno != EEXIST) {
            throw ConfigError(cur + ": " + strerror(errno));
        }
    }
}

void CredentialStore::save() const {
    json j = json::object();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        j["default_interface"] = defaultInterface_ ? json(*defaultInterface_) : json(nullptr);
        j["networks"] = json::array();
        for (auto &c : networks_) {
            json n = { {"ssid", c.ssid}, {"password", c.password} };
            if (!c.interfaceName.empty()) n["interface"] = c.interfaceName;
            j["networks"].push_back(std::move(n));
        }
    }

    size_t slash = path_.rfind('/');
    if (slash != std::string::npos) makeDirs(path_.substr(0, slash));

    const std::string tmp = path_ + ".tmp";
    const std::string text = j.dump(2) + "\n";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) throw ConfigError(tmp + ": " + strerror(errno));
    size_t off = 0;
    while (off < text.size()) {
        ssize_t n = ::write(fd, text.data() + off, text.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw ConfigError(tmp + ": " + strerror(e));
        }
        off += (size_t)n;
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        int e = errno;
        ::unlink(tmp.c_str());
        throw ConfigError(tmp + ": " + strerror(e));
    }
    if (::rename(tmp.c_str(), path_.c_str()) != 0) {
        int e = errno;
        ::unlink(tmp.c_str());
        throw ConfigError(path_ + ": " + strerror(e));
    }
}

std::optional<NetworkCredential> CredentialStore::lookup(const std::string &ssid, const std::string &interfaceName) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &c : networks_) {
        if (c.ssid == ssid && c.interfaceName == interfaceName) return c;
    }
    for (auto &c : networks_) {
        if (c.ssid == ssid && c.interfaceName.empty()) return c;
    }
    return std::nullopt;
}

void CredentialStore::put(NetworkCredential cred) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &c : networks_) {
        if (c.ssid == cred.ssid && c.interfaceName == cred.interfaceName) {
            c.password = std::move(cred.password);
            return;
        }
    }
    networks_.push_back(std::move(cred));
}

std::vector<NetworkCredential> CredentialStore::networks() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return networks_;
}

std::optional<std::string> CredentialStore::defaultInterface() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return defaultInterface_;
}

} // namespace wifiproxy
