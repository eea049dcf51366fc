#pragma once
#include <string>
#include <vector>

namespace wifiproxy {

struct DeviceInfo {
    std::string name;
    std::string state;   // facility wording, e.g. "connected", "disconnected", "unavailable"
    bool usb = false;
};

struct LinkStatus {
    bool present = false;
    bool connected = false;
    bool activating = false;
    std::string stateText;
    std::string ssid;
    std::string localAddress;   // without prefix length
    int prefixLength = 0;
    std::string gateway;
};

struct AccessPoint {
    std::string ssid;
    int signal = 0;             // 0..100
    std::string security;
    bool inUse = false;
};

// Host network-management facility. Implementations throw InterfaceError.
class NetworkBackend {
public:
    virtual ~NetworkBackend() = default;

    virtual std::vector<DeviceInfo> listWifiDevices() = 0;
    // Blocks until the association succeeds or fails
    virtual void associate(const std::string &iface, const std::string &ssid, const std::string &password) = 0;
    virtual void disassociate(const std::string &iface) = 0;
    virtual LinkStatus query(const std::string &iface) = 0;
    virtual std::vector<AccessPoint> scan(const std::string &iface) = 0;
};

} // namespace wifiproxy
