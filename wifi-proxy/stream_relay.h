#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace wifiproxy {

struct StreamFrame {
    uint64_t seq = 0;           // relay-local, strictly increasing
    std::string payload;        // one JPEG image
    std::chrono::steady_clock::time_point captured;
};
using FramePtr = std::shared_ptr<const StreamFrame>;

// Upstream producer of frames. Implementations may block in open() and readFrame().
class FrameSource {
public:
    virtual ~FrameSource() = default;
    // Throws GatewayUnreachable
    virtual void open() = 0;
    // Next frame payload; false when the upstream ended. Throws ProxyError on a broken stream.
    virtual bool readFrame(std::string &payload) = 0;
    // Called from another thread; must make a blocked open()/readFrame() return or throw soon
    virtual void interrupt() = 0;
    virtual void close() = 0;
};
using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>()>;

// One consumer's bounded view of the relay. When full the oldest frame is dropped.
class StreamSubscription {
public:
    enum class State { Active, Closed, Failed };
    enum class WaitResult { Frame, Timeout, Closed, Failed };

    StreamSubscription(uint64_t id, size_t capacity) : id_(id), capacity_(capacity ? capacity : 1) {}

    uint64_t id() const { return id_; }
    WaitResult waitFrame(FramePtr &out, std::chrono::milliseconds timeout);
    bool tryPop(FramePtr &out);
    State state() const;
    std::string failureReason() const;
    uint64_t dropped() const;
    // Invoked on the relay's reader thread after each push and on close/fail
    void setNotify(std::function<void()> fn);

private:
    friend class StreamRelay;
    void push(FramePtr f);
    void finish(State st, const std::string &reason);

    const uint64_t id_;
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<FramePtr> frames_;
    State state_ = State::Active;
    std::string reason_;
    uint64_t dropped_ = 0;
    std::function<void()> notify_;
};

struct RelayOptions {
    size_t bufferFrames = 3;
    int maxReconnects = 5;
    int retryBaseMs = 500;
    int retryMaxMs = 4000;
};

struct RelayStats {
    uint64_t upstreamOpens = 0;
    uint64_t framesRelayed = 0;
    size_t subscribers = 0;
    bool upstreamConnected = false;
};

// Single upstream reader, N subscribers. The upstream is opened when the first
// subscriber arrives and released when the last one leaves.
class StreamRelay {
public:
    explicit StreamRelay(FrameSourceFactory factory, RelayOptions opts = {});
    ~StreamRelay();
    StreamRelay(const StreamRelay&) = delete;
    StreamRelay &operator=(const StreamRelay&) = delete;

    // Throws ProxyError after shutdown()
    std::shared_ptr<StreamSubscription> subscribe();
    void unsubscribe(uint64_t id);
    // Closes every subscription and stops the reader thread
    void shutdown();

    RelayStats stats() const;
    // Receives upstream connected/disconnected transitions (reader thread)
    void setStateCallback(std::function<void(bool)> cb);

private:
    void readerLoop();
    bool shouldRunLocked() const { return !shutdown_ && !subs_.empty(); }
    void fanOut(const FramePtr &f);
    void failAll(const std::string &reason);
    void setConnected(bool connected);

    FrameSourceFactory factory_;
    RelayOptions opts_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<uint64_t, std::shared_ptr<StreamSubscription>> subs_;
    uint64_t nextId_ = 1;
    bool shutdown_ = false;
    FrameSource *active_ = nullptr;
    RelayStats stats_;
    std::function<void(bool)> stateCb_;

    uint64_t seq_ = 0;      // reader thread only
    std::thread reader_;
};

} // namespace wifiproxy
