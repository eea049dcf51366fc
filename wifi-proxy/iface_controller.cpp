#include "iface_controller.h"
#include "errors.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace wifiproxy {

const char *toString(IfaceState s) {
    switch (s) {
        case IfaceState::Disconnected: return "Disconnected";
        case IfaceState::Connecting: return "Connecting";
        case IfaceState::Connected: return "Connected";
        case IfaceState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string linkProblem(const InterfaceStatus &st) {
    if (st.state != IfaceState::Connected) return st.name + " is not connected (" + toString(st.state) + ")";
    if (!st.localAddress || st.localAddress->empty()) return st.name + " has no local address; is DHCP finished?";
    if (!st.gatewayAddress || st.gatewayAddress->empty()) return st.name + " has no gateway address; is DHCP finished?";
    return "";
}

static std::optional<std::string> nonEmpty(const std::string &s) {
    if (s.empty()) return std::nullopt;
    return s;
}

InterfaceController::InterfaceController(NetworkBackend &backend, CredentialStore *store)
    : backend_(backend), store_(store) {}

void InterfaceController::setRetryPolicy(int maxAttempts, int baseDelayMs) {
    maxAttempts_ = std::max(1, maxAttempts);
    baseDelayMs_ = std::max(0, baseDelayMs);
}

InterfaceController::Slot &InterfaceController::slot(const std::string &iface) {
    std::lock_guard<std::mutex> lk(slotsMtx_);
    auto &p = slots_[iface];
    if (!p) {
        p = std::make_unique<Slot>();
        p->st.name = iface;
    }
    return *p;
}

const InterfaceController::Slot *InterfaceController::findSlot(const std::string &iface) const {
    std::lock_guard<std::mutex> lk(slotsMtx_);
    auto it = slots_.find(iface);
    return it == slots_.end() ? nullptr : it->second.get();
}

void InterfaceController::setFailed(Slot &s, IfaceState state, const std::string &reason) {
    std::lock_guard<std::mutex> lk(s.stateMtx);
    s.st.state = state;
    s.st.localAddress.reset();
    s.st.gatewayAddress.reset();
    if (state == IfaceState::Disconnected) s.st.ssid.reset();
    s.st.lastError = reason;
}

InterfaceStatus InterfaceController::connect(const std::string &ssid, const std::optional<std::string> &password,
                                             const std::string &iface, bool save) {
    using C = InterfaceError::Code;
    if (ssid.empty()) throw InterfaceError(C::AssociationRejected, "SSID must not be empty");

    Slot &s = slot(iface);
    {
        std::lock_guard<std::mutex> lk(s.stateMtx);
        if (s.st.state == IfaceState::Connecting) {
            throw InterfaceError(C::AlreadyInProgress, "a connect on " + iface + " is already in progress");
        }
        s.st.state = IfaceState::Connecting;
        s.st.ssid = ssid;
        s.st.lastError.reset();
    }

    std::lock_guard<std::mutex> op(s.opMtx);
    InterfaceStatus snapshot;
    try {
        std::optional<std::string> pw = password;
        if (!pw && store_) {
            if (auto saved = store_->lookup(ssid, iface)) pw = saved->password;
        }

        LinkStatus cur = backend_.query(iface);
        if (!cur.present) throw InterfaceError(C::NotFound, "interface " + iface + " not found");

        if (cur.connected && cur.ssid == ssid) {
            std::cout << "[iface] " << iface << " already associated with '" << ssid << "'\n";
        } else {
            // An explicit empty password selects an open network
            if (!pw) {
                throw InterfaceError(C::AssociationRejected,
                                     "no password provided and no saved credential for '" + ssid + "'");
            }
            std::cout << "[iface] Connecting " << iface << " to '" << ssid << "'...\n";
            for (int attempt = 0;; ++attempt) {
                try {
                    backend_.associate(iface, ssid, *pw);
                    break;
                } catch (const InterfaceError &e) {
                    if (e.code() != C::AssociationTimeout || attempt + 1 >= maxAttempts_) throw;
                    int delay = baseDelayMs_ << attempt;
                    std::cout << "[iface] " << e.what() << ". Retry in " << delay << "ms (attempt "
                              << (attempt + 1) << ")\n";
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                }
            }
            cur = backend_.query(iface);
        }

        std::lock_guard<std::mutex> lk(s.stateMtx);
        s.st.state = IfaceState::Connected;
        s.st.ssid = ssid;
        s.st.localAddress = nonEmpty(cur.localAddress);
        s.st.gatewayAddress = nonEmpty(cur.gateway);
        s.st.lastError.reset();
        snapshot = s.st;
    } catch (const InterfaceError &e) {
        bool assoc = e.code() == C::AssociationTimeout || e.code() == C::AssociationRejected;
        setFailed(s, assoc ? IfaceState::Failed : IfaceState::Disconnected, e.what());
        throw;
    } catch (const std::exception &e) {
        setFailed(s, IfaceState::Failed, e.what());
        throw;
    }

    std::cout << "[iface] " << iface << " connected to '" << ssid << "'"
              << " local=" << snapshot.localAddress.value_or("?")
              << " gateway=" << snapshot.gatewayAddress.value_or("?") << "\n";

    // Still under opMtx: saves are serialized with connects
    if (save && store_ && password) {
        store_->put(NetworkCredential{ssid, *password, iface});
        store_->save();
        std::cout << "[iface] Saved credentials for '" << ssid << "' to " << store_->path() << "\n";
    }
    return snapshot;
}

void InterfaceController::disconnect(const std::string &iface) {
    Slot &s = slot(iface);
    auto busy = [&]() {
        return InterfaceError(InterfaceError::Code::Busy, "a connect on " + iface + " is in progress");
    };
    {
        std::lock_guard<std::mutex> lk(s.stateMtx);
        if (s.st.state == IfaceState::Connecting) throw busy();
    }
    std::lock_guard<std::mutex> op(s.opMtx);
    {
        std::lock_guard<std::mutex> lk(s.stateMtx);
        if (s.st.state == IfaceState::Connecting) throw busy();
        if (s.st.state == IfaceState::Disconnected) return;
    }

    backend_.disassociate(iface);

    std::lock_guard<std::mutex> lk(s.stateMtx);
    if (s.st.state != IfaceState::Connecting) {
        s.st = InterfaceStatus{};
        s.st.name = iface;
    }
    std::cout << "[iface] " << iface << " disconnected\n";
}

InterfaceStatus InterfaceController::status(const std::string &iface) const {
    const Slot *s = findSlot(iface);
    if (!s) {
        InterfaceStatus st;
        st.name = iface;
        return st;
    }
    std::lock_guard<std::mutex> lk(s->stateMtx);
    return s->st;
}

InterfaceStatus InterfaceController::refresh(const std::string &iface) {
    Slot &s = slot(iface);
    {
        std::lock_guard<std::mutex> lk(s.stateMtx);
        if (s.st.state == IfaceState::Connecting) return s.st;
    }
    std::lock_guard<std::mutex> op(s.opMtx);
    LinkStatus cur = backend_.query(iface);
    if (!cur.present) {
        throw InterfaceError(InterfaceError::Code::NotFound, "interface " + iface + " not found");
    }

    std::lock_guard<std::mutex> lk(s.stateMtx);
    if (s.st.state == IfaceState::Connecting) return s.st;
    if (cur.connected) {
        s.st.state = IfaceState::Connected;
        s.st.ssid = nonEmpty(cur.ssid);
        s.st.localAddress = nonEmpty(cur.localAddress);
        s.st.gatewayAddress = nonEmpty(cur.gateway);
        s.st.lastError.reset();
    } else if (s.st.state != IfaceState::Failed) {
        s.st.state = IfaceState::Disconnected;
        s.st.ssid.reset();
        s.st.localAddress.reset();
        s.st.gatewayAddress.reset();
    }
    return s.st;
}

std::vector<AccessPoint> InterfaceController::scan(const std::string &iface) {
    Slot &s = slot(iface);
    {
        std::lock_guard<std::mutex> lk(s.stateMtx);
        if (s.st.state == IfaceState::Connecting) {
            throw InterfaceError(InterfaceError::Code::Busy, iface + " is connecting; scan later");
        }
    }
    std::unique_lock<std::mutex> op(s.opMtx, std::try_to_lock);
    if (!op.owns_lock()) {
        throw InterfaceError(InterfaceError::Code::Busy, iface + " is busy; scan later");
    }
    return backend_.scan(iface);
}

std::vector<DeviceInfo> InterfaceController::listInterfaces() {
    return backend_.listWifiDevices();
}

std::string InterfaceController::resolveInterface(const std::optional<std::string> &requested) {
    if (requested && !requested->empty()) return *requested;
    if (store_) {
        if (auto def = store_->defaultInterface()) return *def;
    }
    for (auto &d : backend_.listWifiDevices()) {
        if (d.usb) return d.name;
    }
    throw InterfaceError(InterfaceError::Code::NotFound,
                         "no USB Wi-Fi adapter found; pass --interface or set default_interface in the config");
}

} // namespace wifiproxy
