#include "subscriber_registry.h"

namespace wifiproxy {

const char *toString(ProxySubscriber::Kind k) {
    return k == ProxySubscriber::Kind::Stream ? "stream" : "control";
}

uint64_t SubscriberRegistry::add(ProxySubscriber::Kind kind, const std::string &peer, const std::string &session,
                                 bool persistent) {
    std::lock_guard<std::mutex> lk(mtx_);
    ProxySubscriber s;
    s.id = nextId_++;
    s.kind = kind;
    s.peer = peer;
    s.session = session;
    s.persistent = persistent;
    s.lastSeen = std::chrono::steady_clock::now();
    subs_[s.id] = s;
    return s.id;
}

uint64_t SubscriberRegistry::touchSession(const std::string &session, const std::string &peer) {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto now = std::chrono::steady_clock::now();
    for (auto &kv : subs_) {
        auto &s = kv.second;
        if (s.kind == ProxySubscriber::Kind::Control && !s.persistent && s.session == session) {
            s.lastSeen = now;
            return s.id;
        }
    }
    ProxySubscriber s;
    s.id = nextId_++;
    s.kind = ProxySubscriber::Kind::Control;
    s.peer = peer;
    s.session = session;
    s.lastSeen = now;
    subs_[s.id] = s;
    return s.id;
}

void SubscriberRegistry::touch(uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = subs_.find(id);
    if (it != subs_.end()) it->second.lastSeen = std::chrono::steady_clock::now();
}

bool SubscriberRegistry::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    return subs_.erase(id) > 0;
}

std::vector<ProxySubscriber> SubscriberRegistry::reapIdle(std::chrono::milliseconds idle) {
    std::vector<ProxySubscriber> out;
    std::lock_guard<std::mutex> lk(mtx_);
    const auto cutoff = std::chrono::steady_clock::now() - idle;
    for (auto it = subs_.begin(); it != subs_.end();) {
        if (!it->second.persistent && it->second.lastSeen < cutoff) {
            out.push_back(it->second);
            it = subs_.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

std::vector<ProxySubscriber> SubscriberRegistry::clear() {
    std::vector<ProxySubscriber> out;
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : subs_) out.push_back(kv.second);
    subs_.clear();
    return out;
}

std::vector<ProxySubscriber> SubscriberRegistry::snapshot() const {
    std::vector<ProxySubscriber> out;
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : subs_) out.push_back(kv.second);
    return out;
}

size_t SubscriberRegistry::count(ProxySubscriber::Kind kind) const {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0;
    for (auto &kv : subs_) if (kv.second.kind == kind) ++n;
    return n;
}

} // namespace wifiproxy
