#include "stream_relay.h"
#include "errors.h"
#include "net_util.h"

#include <iostream>
#include <vector>

namespace wifiproxy {

// --------------- StreamSubscription ---------------
StreamSubscription::WaitResult StreamSubscription::waitFrame(FramePtr &out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [this] { return !frames_.empty() || state_ != State::Active; });
    if (!frames_.empty()) {
        out = std::move(frames_.front());
        frames_.pop_front();
        return WaitResult::Frame;
    }
    if (state_ == State::Closed) return WaitResult::Closed;
    if (state_ == State::Failed) return WaitResult::Failed;
    return WaitResult::Timeout;
}

bool StreamSubscription::tryPop(FramePtr &out) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (frames_.empty()) return false;
    out = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

StreamSubscription::State StreamSubscription::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::string StreamSubscription::failureReason() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reason_;
}

uint64_t StreamSubscription::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}

void StreamSubscription::setNotify(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    notify_ = std::move(fn);
}

void StreamSubscription::push(FramePtr f) {
    std::function<void()> notify;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != State::Active) return;
        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            ++dropped_;
        }
        frames_.push_back(std::move(f));
        notify = notify_;
    }
    cv_.notify_all();
    if (notify) notify();
}

void StreamSubscription::finish(State st, const std::string &reason) {
    std::function<void()> notify;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != State::Active) return;
        state_ = st;
        reason_ = reason;
        notify = notify_;
    }
    cv_.notify_all();
    if (notify) notify();
}

// --------------- StreamRelay ---------------
StreamRelay::StreamRelay(FrameSourceFactory factory, RelayOptions opts)
    : factory_(std::move(factory)), opts_(opts) {
    reader_ = std::thread([this] { readerLoop(); });
}

StreamRelay::~StreamRelay() {
    shutdown();
}

std::shared_ptr<StreamSubscription> StreamRelay::subscribe() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shutdown_) throw ProxyError("stream relay is shut down");
    auto sub = std::make_shared<StreamSubscription>(nextId_++, opts_.bufferFrames);
    subs_[sub->id()] = sub;
    stats_.subscribers = subs_.size();
    cv_.notify_all();
    return sub;
}

void StreamRelay::unsubscribe(uint64_t id) {
    std::shared_ptr<StreamSubscription> sub;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = subs_.find(id);
        if (it == subs_.end()) return;
        sub = std::move(it->second);
        subs_.erase(it);
        stats_.subscribers = subs_.size();
        // Last one out releases the upstream
        if (subs_.empty() && active_) active_->interrupt();
        cv_.notify_all();
    }
    sub->finish(StreamSubscription::State::Closed, "");
}

void StreamRelay::shutdown() {
    std::map<uint64_t, std::shared_ptr<StreamSubscription>> subs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutdown_) return;
        shutdown_ = true;
        subs.swap(subs_);
        stats_.subscribers = 0;
        if (active_) active_->interrupt();
        cv_.notify_all();
    }
    for (auto &kv : subs) kv.second->finish(StreamSubscription::State::Closed, "");
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) reader_.join();
}

RelayStats StreamRelay::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

void StreamRelay::setStateCallback(std::function<void(bool)> cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    stateCb_ = std::move(cb);
}

void StreamRelay::setConnected(bool connected) {
    std::function<void(bool)> cb;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stats_.upstreamConnected == connected) return;
        stats_.upstreamConnected = connected;
        cb = stateCb_;
    }
    if (cb) cb(connected);
}

void StreamRelay::fanOut(const FramePtr &f) {
    std::vector<std::shared_ptr<StreamSubscription>> targets;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        targets.reserve(subs_.size());
        for (auto &kv : subs_) targets.push_back(kv.second);
        ++stats_.framesRelayed;
    }
    // Never blocks: a full subscriber just loses its oldest frame
    for (auto &s : targets) s->push(f);
}

void StreamRelay::failAll(const std::string &reason) {
    std::map<uint64_t, std::shared_ptr<StreamSubscription>> subs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        subs.swap(subs_);
        stats_.subscribers = 0;
    }
    for (auto &kv : subs) kv.second->finish(StreamSubscription::State::Failed, reason);
}

void StreamRelay::readerLoop() {
    int failures = 0;
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return shutdown_ || !subs_.empty(); });
            if (shutdown_) return;
        }

        std::unique_ptr<FrameSource> src = factory_();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!shouldRunLocked()) continue;
            active_ = src.get();
        }

        std::string reason;
        bool opened = false;
        try {
            std::cout << "[relay] Opening upstream stream...\n";
            src->open();
            opened = true;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                ++stats_.upstreamOpens;
            }
            setConnected(true);
            std::cout << "[relay] Upstream connected\n";

            for (;;) {
                std::string payload;
                if (!src->readFrame(payload)) {
                    reason = "upstream closed the stream";
                    break;
                }
                failures = 0;
                auto f = std::make_shared<StreamFrame>();
                f->seq = ++seq_;
                f->payload = std::move(payload);
                f->captured = std::chrono::steady_clock::now();
                fanOut(f);

                std::lock_guard<std::mutex> lk(mtx_);
                if (!shouldRunLocked()) break;
            }
        } catch (const std::exception &e) {
            // GatewayUnreachable from open(), ProxyError from readFrame()
            reason = e.what();
        }

        {
            std::lock_guard<std::mutex> lk(mtx_);
            active_ = nullptr;
        }
        src->close();
        src.reset();
        if (opened) setConnected(false);

        bool run;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            run = shouldRunLocked();
        }
        if (!run) {
            std::cout << "[relay] Upstream released\n";
            failures = 0;
            continue;
        }

        ++failures;
        if (failures > opts_.maxReconnects) {
            std::cerr << "[relay] Giving up after " << opts_.maxReconnects << " reconnects: " << reason << "\n";
            failAll("gateway unreachable: " + reason);
            failures = 0;
            continue;
        }
        int delay = computeBackoffMs(opts_.retryBaseMs, opts_.retryMaxMs, failures - 1);
        std::cout << "[relay] " << reason << ". Reconnect in ~" << delay << "ms (attempt "
                  << failures << "/" << opts_.maxReconnects << ")\n";
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(delay), [this] { return !shouldRunLocked(); });
    }
}

} // namespace wifiproxy
