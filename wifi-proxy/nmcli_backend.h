#pragma once
#include "command_runner.h"
#include "errors.h"
#include "network_backend.h"

#include <string>
#include <vector>

namespace wifiproxy {

// NetworkManager through its CLI (nmcli -t terse output)
class NmcliBackend : public NetworkBackend {
public:
    explicit NmcliBackend(int associateTimeoutSec = 30, std::string sysNetRoot = "/sys/class/net");

    std::vector<DeviceInfo> listWifiDevices() override;
    void associate(const std::string &iface, const std::string &ssid, const std::string &password) override;
    void disassociate(const std::string &iface) override;
    LinkStatus query(const std::string &iface) override;
    std::vector<AccessPoint> scan(const std::string &iface) override;

    // Output parsers and error classification, public for tests
    static std::vector<std::string> splitTerse(const std::string &line);
    static std::vector<DeviceInfo> parseDeviceList(const std::string &out);
    static LinkStatus parseDeviceShow(const std::string &out);
    static std::vector<AccessPoint> parseWifiList(const std::string &out);
    static InterfaceError classifyFailure(const CmdResult &r, const std::string &what);
    static bool isUsbDevice(const std::string &iface, const std::string &sysNetRoot);

private:
    CmdResult nmcli(std::vector<std::string> args, int timeoutMs);

    int associateTimeoutSec_;
    std::string sysNetRoot_;
};

} // namespace wifiproxy
