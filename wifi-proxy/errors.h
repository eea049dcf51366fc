#pragma once
#include <stdexcept>
#include <string>

namespace wifiproxy {

// Failures of the secondary interface lifecycle. Only AssociationTimeout is retried.
class InterfaceError : public std::runtime_error {
public:
    enum class Code {
        NotFound,
        AssociationTimeout,
        AssociationRejected,
        AlreadyInProgress,
        Busy,
        BackendUnavailable
    };

    InterfaceError(Code code, const std::string &msg) : std::runtime_error(msg), code_(code) {}
    Code code() const { return code_; }

private:
    Code code_;
};

inline const char *toString(InterfaceError::Code c) {
    switch (c) {
        case InterfaceError::Code::NotFound: return "NotFound";
        case InterfaceError::Code::AssociationTimeout: return "AssociationTimeout";
        case InterfaceError::Code::AssociationRejected: return "AssociationRejected";
        case InterfaceError::Code::AlreadyInProgress: return "AlreadyInProgress";
        case InterfaceError::Code::Busy: return "Busy";
        case InterfaceError::Code::BackendUnavailable: return "BackendUnavailable";
    }
    return "Unknown";
}

// The device behind the secondary interface did not answer (after retries).
class GatewayUnreachable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed credential file, bad environment value, bad option.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Upstream media stream ended or broke while subscribers were attached.
class ProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wifiproxy
