#include "nmcli_backend.h"
#include "net_util.h"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <map>
#include <thread>

namespace wifiproxy {

NmcliBackend::NmcliBackend(int associateTimeoutSec, std::string sysNetRoot)
    : associateTimeoutSec_(associateTimeoutSec), sysNetRoot_(std::move(sysNetRoot)) {}

CmdResult NmcliBackend::nmcli(std::vector<std::string> args, int timeoutMs) {
    args.insert(args.begin(), "nmcli");
    CmdResult r = runCommandWithTimeout(args, timeoutMs);
    // These two are never retried or reinterpreted by callers
    if (r.code == 127) {
        throw InterfaceError(InterfaceError::Code::BackendUnavailable, "nmcli not found; is NetworkManager installed?");
    }
    if (r.code == 8) {
        throw InterfaceError(InterfaceError::Code::BackendUnavailable, "NetworkManager is not running");
    }
    return r;
}

// nmcli -t separates fields with ':' and escapes ':' and '\' inside values
std::vector<std::string> NmcliBackend::splitTerse(const std::string &line) {
    std::vector<std::string> out;
    std::string cur;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            cur.push_back(line[++i]);
        } else if (c == ':') {
            out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(std::move(cur));
    return out;
}

std::vector<DeviceInfo> NmcliBackend::parseDeviceList(const std::string &out) {
    std::vector<DeviceInfo> devs;
    for (auto &raw : split(out, '\n')) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        auto f = splitTerse(line);
        if (f.size() < 3 || f[1] != "wifi") continue;
        DeviceInfo d;
        d.name = f[0];
        d.state = f[2];
        devs.push_back(std::move(d));
    }
    return devs;
}

LinkStatus NmcliBackend::parseDeviceShow(const std::string &out) {
    LinkStatus st;
    for (auto &raw : split(out, '\n')) {
        std::string line = trim(raw);
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        auto parts = splitTerse(line.substr(colon + 1));
        std::string value = parts[0];
        for (size_t i = 1; i < parts.size(); ++i) value += ":" + parts[i];

        if (key == "GENERAL.DEVICE") {
            st.present = true;
        } else if (key == "GENERAL.STATE") {
            // "100 (connected)"
            st.present = true;
            int code = std::atoi(value.c_str());
            size_t lp = value.find('('), rp = value.rfind(')');
            st.stateText = (lp != std::string::npos && rp != std::string::npos && rp > lp)
                ? value.substr(lp + 1, rp - lp - 1) : value;
            st.connected = (code == 100);
            st.activating = (code >= 40 && code < 100);
        } else if (key == "GENERAL.CONNECTION") {
            if (!value.empty() && value != "--") st.ssid = value;
        } else if (key == "IP4.ADDRESS[1]") {
            size_t slash = value.find('/');
            st.localAddress = value.substr(0, slash);
            if (slash != std::string::npos) st.prefixLength = std::atoi(value.c_str() + slash + 1);
        } else if (key == "IP4.GATEWAY") {
            if (!value.empty() && value != "--") st.gateway = value;
        }
    }
    return st;
}

// Fields: IN-USE,SSID,SIGNAL,SECURITY
std::vector<AccessPoint> NmcliBackend::parseWifiList(const std::string &out) {
    std::vector<AccessPoint> aps;
    std::map<std::string, size_t> index;
    for (auto &raw : split(out, '\n')) {
        if (trim(raw).empty()) continue;
        auto f = splitTerse(raw);
        if (f.size() < 4) continue;
        AccessPoint ap;
        ap.inUse = trim(f[0]) == "*";
        ap.ssid = f[1];
        if (ap.ssid.empty()) continue; // hidden
        ap.signal = std::clamp(std::atoi(f[2].c_str()), 0, 100);
        ap.security = trim(f[3]);
        if (ap.security == "--") ap.security.clear();

        auto it = index.find(ap.ssid);
        if (it == index.end()) {
            index[ap.ssid] = aps.size();
            aps.push_back(std::move(ap));
        } else {
            AccessPoint &prev = aps[it->second];
            prev.inUse = prev.inUse || ap.inUse;
            if (ap.signal > prev.signal) {
                prev.signal = ap.signal;
                prev.security = ap.security;
            }
        }
    }
    std::stable_sort(aps.begin(), aps.end(), [](const AccessPoint &a, const AccessPoint &b) {
        return a.signal > b.signal;
    });
    return aps;
}

InterfaceError NmcliBackend::classifyFailure(const CmdResult &r, const std::string &what) {
    std::string msg = trim(r.err.empty() ? r.out : r.err);
    if (msg.empty()) msg = "nmcli exited with code " + std::to_string(r.code);
    const std::string low = toLower(msg);
    const std::string text = what + ": " + msg;
    using C = InterfaceError::Code;

    switch (r.code) {
        case 127:
        case 8:
            return InterfaceError(C::BackendUnavailable, text);
        case 124:
        case 3:
            return InterfaceError(C::AssociationTimeout, text);
        case 10:
            // The AP may still be booting; "device not found" is permanent
            if (low.find("no network with ssid") != std::string::npos) return InterfaceError(C::AssociationTimeout, text);
            return InterfaceError(C::NotFound, text);
        case 4:
            if (low.find("timeout") != std::string::npos || low.find("timed out") != std::string::npos) {
                return InterfaceError(C::AssociationTimeout, text);
            }
            return InterfaceError(C::AssociationRejected, text);
        default:
            break;
    }
    if (low.find("not found") != std::string::npos || low.find("does not exist") != std::string::npos) {
        return InterfaceError(C::NotFound, text);
    }
    return InterfaceError(C::AssociationRejected, text);
}

bool NmcliBackend::isUsbDevice(const std::string &iface, const std::string &sysNetRoot) {
    const std::string devLink = sysNetRoot + "/" + iface + "/device";
    char resolved[PATH_MAX];
    if (::realpath(devLink.c_str(), resolved)) {
        if (std::string(resolved).find("/usb") != std::string::npos) return true;
    }
    std::string uevent;
    if (readFileToString(devLink + "/uevent", uevent)) {
        return toLower(uevent).find("usb") != std::string::npos;
    }
    return false;
}

std::vector<DeviceInfo> NmcliBackend::listWifiDevices() {
    CmdResult r = nmcli({"-t", "-f", "DEVICE,TYPE,STATE", "device"}, 10000);
    if (r.code != 0) throw classifyFailure(r, "list devices");
    auto devs = parseDeviceList(r.out);
    for (auto &d : devs) d.usb = isUsbDevice(d.name, sysNetRoot_);
    return devs;
}

void NmcliBackend::associate(const std::string &iface, const std::string &ssid, const std::string &password) {
    std::vector<std::string> args = {"-w", std::to_string(associateTimeoutSec_), "device", "wifi", "connect", ssid};
    if (!password.empty()) {
        args.push_back("password");
        args.push_back(password);
    }
    args.push_back("ifname");
    args.push_back(iface);
    CmdResult r = nmcli(std::move(args), associateTimeoutSec_ * 1000 + 5000);
    if (r.code != 0) throw classifyFailure(r, "connect " + iface + " to '" + ssid + "'");
}

void NmcliBackend::disassociate(const std::string &iface) {
    CmdResult r = nmcli({"device", "disconnect", iface}, 15000);
    if (r.code == 0) return;
    const std::string low = toLower(r.err);
    if (low.find("not active") != std::string::npos || low.find("not connected") != std::string::npos) return;
    throw classifyFailure(r, "disconnect " + iface);
}

LinkStatus NmcliBackend::query(const std::string &iface) {
    CmdResult r = nmcli({"-t", "device", "show", iface}, 10000);
    if (r.code == 10) return LinkStatus{};
    if (r.code != 0) throw classifyFailure(r, "show " + iface);
    LinkStatus st = parseDeviceShow(r.out);
    if (!st.connected) return st;

    // GENERAL.CONNECTION is the profile name; the associated SSID comes from the AP list
    CmdResult w = nmcli({"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi", "list",
                         "ifname", iface, "--rescan", "no"}, 10000);
    if (w.code == 0) {
        for (auto &ap : parseWifiList(w.out)) {
            if (ap.inUse) { st.ssid = ap.ssid; break; }
        }
    }
    return st;
}

std::vector<AccessPoint> NmcliBackend::scan(const std::string &iface) {
    CmdResult rs = nmcli({"device", "wifi", "rescan", "ifname", iface}, 15000);
    if (rs.code == 10) throw classifyFailure(rs, "rescan " + iface);
    if (rs.code != 0) {
        // e.g. "Scanning not allowed immediately following previous scan"
        std::cerr << "[iface] rescan " << iface << ": " << trim(rs.err) << " (listing cached results)\n";
    } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    CmdResult r = nmcli({"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi", "list",
                         "ifname", iface, "--rescan", "no"}, 15000);
    if (r.code != 0) throw classifyFailure(r, "scan " + iface);
    return parseWifiList(r.out);
}

} // namespace wifiproxy
