#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wifiproxy {

// A browser connection attached to the stream or to a control channel
struct ProxySubscriber {
    enum class Kind { Stream, Control };

    uint64_t id = 0;
    Kind kind = Kind::Stream;
    std::string session;        // control only
    std::string peer;
    bool persistent = false;    // lives as long as its socket (stream, WebSocket)
    std::chrono::steady_clock::time_point lastSeen;
};

class SubscriberRegistry {
public:
    uint64_t add(ProxySubscriber::Kind kind, const std::string &peer, const std::string &session, bool persistent);
    // Finds or creates the non-persistent control subscriber for session and refreshes it
    uint64_t touchSession(const std::string &session, const std::string &peer);
    void touch(uint64_t id);
    bool remove(uint64_t id);

    // Removes and returns non-persistent subscribers idle for longer than idle
    std::vector<ProxySubscriber> reapIdle(std::chrono::milliseconds idle);
    // Removes and returns everything
    std::vector<ProxySubscriber> clear();

    std::vector<ProxySubscriber> snapshot() const;
    size_t count(ProxySubscriber::Kind kind) const;

private:
    mutable std::mutex mtx_;
    uint64_t nextId_ = 1;
    std::map<uint64_t, ProxySubscriber> subs_;
};

const char *toString(ProxySubscriber::Kind k);

} // namespace wifiproxy
