#pragma once
#include "credential_store.h"
#include "network_backend.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wifiproxy {

enum class IfaceState { Disconnected, Connecting, Connected, Failed };
const char *toString(IfaceState s);

struct InterfaceStatus {
    std::string name;
    IfaceState state = IfaceState::Disconnected;
    std::optional<std::string> ssid;
    std::optional<std::string> localAddress;
    std::optional<std::string> gatewayAddress;
    std::optional<std::string> lastError;
};

// Why gateway traffic cannot be pinned to this interface; "" when it can
std::string linkProblem(const InterfaceStatus &st);

// Owns the association state of every secondary interface it is asked about.
// connect/disconnect/scan on one interface are serialized by a per-name lock;
// different interfaces proceed independently.
class InterfaceController {
public:
    // store may be null (no credential lookup, no save)
    InterfaceController(NetworkBackend &backend, CredentialStore *store);

    // maxAttempts applies to AssociationTimeout only; the delay doubles per attempt
    void setRetryPolicy(int maxAttempts, int baseDelayMs);

    // Explicit password wins over a saved one; "" joins an open network. Throws InterfaceError
    // (AlreadyInProgress when another connect on the same interface is running,
    // AssociationRejected when association is needed but no password is known).
    // With save, the credential is persisted only after success.
    InterfaceStatus connect(const std::string &ssid, const std::optional<std::string> &password,
                            const std::string &iface, bool save);
    // No-op when already disconnected
    void disconnect(const std::string &iface);
    // Local snapshot, no I/O
    InterfaceStatus status(const std::string &iface) const;
    // Adopt what the host reports for iface into the local snapshot
    InterfaceStatus refresh(const std::string &iface);
    // Deduplicated by SSID, strongest first. Throws Busy while iface is mid-transition.
    std::vector<AccessPoint> scan(const std::string &iface);

    std::vector<DeviceInfo> listInterfaces();
    // requested, else the configured default, else the first USB adapter
    std::string resolveInterface(const std::optional<std::string> &requested);

private:
    struct Slot {
        std::mutex opMtx;            // held for the whole facility operation
        mutable std::mutex stateMtx; // guards st
        InterfaceStatus st;
    };

    Slot &slot(const std::string &iface);
    const Slot *findSlot(const std::string &iface) const;
    void setFailed(Slot &s, IfaceState state, const std::string &reason);

    NetworkBackend &backend_;
    CredentialStore *store_;
    int maxAttempts_ = 3;
    int baseDelayMs_ = 1000;

    mutable std::mutex slotsMtx_;
    std::map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace wifiproxy
