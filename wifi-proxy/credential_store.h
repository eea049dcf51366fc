#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wifiproxy {

// interfaceName == "" means the credential applies to any interface
struct NetworkCredential {
    std::string ssid;
    std::string password;
    std::string interfaceName;
};

// Saved networks plus the preferred secondary interface, persisted as JSON:
//   {"default_interface": "wlan1",
//    "networks": [{"ssid": "...", "password": "...", "interface": "..."}]}
// Entries are unique by (ssid, interface). All methods are thread-safe.
class CredentialStore {
public:
    explicit CredentialStore(std::string path);

    // $WIFI_PROXY_CONFIG, else $XDG_CONFIG_HOME/wifi-proxy/config.json,
    // else ~/.config/wifi-proxy/config.json
    static std::string defaultPath();

    // A missing file is an empty store. Throws ConfigError on unreadable or malformed content.
    void load();
    // Creates parent directories, writes a temp file with mode 0600 and renames it over the old one.
    void save() const;

    // Exact (ssid, interface) match first, then an any-interface entry for the ssid
    std::optional<NetworkCredential> lookup(const std::string &ssid, const std::string &interfaceName) const;
    // Replaces an existing entry with the same (ssid, interface)
    void put(NetworkCredential cred);

    std::vector<NetworkCredential> networks() const;
    std::optional<std::string> defaultInterface() const;
    const std::string &path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mtx_;
    std::optional<std::string> defaultInterface_;
    std::vector<NetworkCredential> networks_;
};

} // namespace wifiproxy
