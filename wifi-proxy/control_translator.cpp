#include "control_translator.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace wifiproxy {

const char *toString(Action a) {
    switch (a) {
        case Action::Stop: return "stop";
        case Action::Stand: return "stand";
        case Action::Sit: return "sit";
        case Action::LightsToggle: return "lights";
    }
    return "unknown";
}

static double clampAxis(double v) {
    return std::max(-1.0, std::min(1.0, v));
}

ControlCommand ControlCommand::move(double dx, double dy) {
    ControlCommand c;
    c.kind = Kind::Move;
    c.dx = clampAxis(dx);
    c.dy = clampAxis(dy);
    return c;
}

ControlCommand ControlCommand::act(Action a) {
    ControlCommand c;
    c.kind = Kind::Action;
    c.action = a;
    return c;
}

bool ControlCommand::operator==(const ControlCommand &o) const {
    if (kind != o.kind) return false;
    if (kind == Kind::Action) return action == o.action;
    return dx == o.dx && dy == o.dy;
}

// --------------- input maps ---------------
static const std::map<std::string, std::pair<int,int>> kMoveKeys = {
    {"KeyW", {0, 1}},  {"ArrowUp", {0, 1}},
    {"KeyS", {0, -1}}, {"ArrowDown", {0, -1}},
    {"KeyA", {-1, 0}}, {"ArrowLeft", {-1, 0}},
    {"KeyD", {1, 0}},  {"ArrowRight", {1, 0}},
};

static const std::map<std::string, Action> kActionKeys = {
    {"Space", Action::Stop},
    {"KeyE", Action::Stand},
    {"KeyQ", Action::Sit},
    {"KeyL", Action::LightsToggle},
};

// Standard gamepad mapping: 12..15 are the D-pad
static const std::map<int, std::pair<int,int>> kDpadButtons = {
    {12, {0, 1}}, {13, {0, -1}}, {14, {-1, 0}}, {15, {1, 0}},
};

static const std::map<int, Action> kActionButtons = {
    {0, Action::Stand}, {1, Action::Stop}, {2, Action::Sit}, {3, Action::LightsToggle},
};

static bool isOneShot(const ControlCommand &c) {
    return c.kind == ControlCommand::Kind::Action && c.action != Action::Stop;
}

std::optional<InputEvent> InputEvent::fromJson(const nlohmann::json &j, const std::string &session) {
    if (!j.is_object()) return std::nullopt;
    const std::string type = j.value("type", "");
    const std::string action = j.value("action", "");

    InputEvent ev;
    ev.session = session;
    if (type == "keyboard") {
        ev.code = j.value("code", "");
        if (ev.code.empty()) return std::nullopt;
        if (action == "down") ev.type = Type::KeyDown;
        else if (action == "up") ev.type = Type::KeyUp;
        else return std::nullopt;
        return ev;
    }
    if (type == "gamepad") {
        ev.index = j.value("index", -1);
        if (ev.index < 0) return std::nullopt;
        if (action == "axis") {
            ev.type = Type::AxisMove;
            ev.value = j.value("value", 0.0);
        } else if (action == "down") {
            ev.type = Type::ButtonDown;
        } else if (action == "up") {
            ev.type = Type::ButtonUp;
        } else {
            return std::nullopt;
        }
        return ev;
    }
    return std::nullopt;
}

// --------------- ControlTranslator ---------------
ControlTranslator::ControlTranslator(CommandSink &sink, TranslatorOptions opts)
    : sink_(sink), opts_(opts) {}

ControlTranslator::~ControlTranslator() {
    stop();
}

void ControlTranslator::start() {
    std::lock_guard<std::mutex> lk(qMtx_);
    if (running_ || worker_.joinable()) return;
    running_ = true;
    worker_ = std::thread([this] { workerLoop(); });
}

void ControlTranslator::stop() {
    {
        std::lock_guard<std::mutex> lk(qMtx_);
        running_ = false;
    }
    qCv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

bool ControlTranslator::dropOldestInputLocked() {
    auto it = std::find_if(queue_.begin(), queue_.end(), [](const InputEvent &e) {
        return e.type != InputEvent::Type::SessionClosed;
    });
    if (it == queue_.end()) return false;
    queue_.erase(it);
    dropped_.fetch_add(1);
    return true;
}

bool ControlTranslator::post(InputEvent ev) {
    bool ok = true;
    {
        std::lock_guard<std::mutex> lk(qMtx_);
        if (queue_.size() >= opts_.queueCapacity) {
            ok = false;
            // Only closes are queued; the new input is the one to go
            if (!dropOldestInputLocked()) {
                dropped_.fetch_add(1);
                return false;
            }
        }
        queue_.push_back(std::move(ev));
    }
    qCv_.notify_one();
    return ok;
}

void ControlTranslator::closeSession(const std::string &session) {
    InputEvent ev;
    ev.session = session;
    ev.type = InputEvent::Type::SessionClosed;
    {
        std::lock_guard<std::mutex> lk(qMtx_);
        // A close is never dropped; it displaces the oldest input instead
        if (queue_.size() >= opts_.queueCapacity) dropOldestInputLocked();
        queue_.push_back(std::move(ev));
    }
    qCv_.notify_one();
}

size_t ControlTranslator::sessionCount() const {
    return sessionCount_.load();
}

double ControlTranslator::deadzone(double v) const {
    v = clampAxis(v);
    double mag = std::fabs(v);
    if (mag < opts_.deadzone) return 0.0;
    double scaled = (mag - opts_.deadzone) / (1.0 - opts_.deadzone);
    // Quantize so stick noise does not count as a change
    scaled = std::round(scaled * 100.0) / 100.0;
    return v < 0 ? -scaled : scaled;
}

ControlCommand ControlTranslator::movementOf(const SessionState &s) const {
    double dx = s.axisX, dy = s.axisY;
    for (auto &k : s.keys) {
        auto it = kMoveKeys.find(k);
        if (it != kMoveKeys.end()) { dx += it->second.first; dy += it->second.second; }
    }
    for (int b : s.buttons) {
        auto it = kDpadButtons.find(b);
        if (it != kDpadButtons.end()) { dx += it->second.first; dy += it->second.second; }
    }
    return ControlCommand::move(dx, dy);
}

void ControlTranslator::applyAction(SessionState &s, Action a) {
    if (a == Action::Stop) {
        s.keys.clear();
        s.buttons.clear();
        s.axisX = 0.0;
        s.axisY = 0.0;
    }
    s.current = ControlCommand::act(a);
}

void ControlTranslator::apply(SessionState &s, const InputEvent &ev) {
    using T = InputEvent::Type;
    switch (ev.type) {
        case T::KeyDown:
            if (kMoveKeys.count(ev.code)) {
                s.keys.insert(ev.code);
                s.current = movementOf(s);
            } else if (auto it = kActionKeys.find(ev.code); it != kActionKeys.end()) {
                // ignore auto-repeat
                if (s.actionKeys.insert(ev.code).second) applyAction(s, it->second);
            }
            break;
        case T::KeyUp:
            s.actionKeys.erase(ev.code);
            if (s.keys.erase(ev.code)) s.current = movementOf(s);
            break;
        case T::AxisMove:
            if (ev.index == 0) s.axisX = deadzone(ev.value);
            else if (ev.index == 1) s.axisY = -deadzone(ev.value);
            else break;
            s.current = movementOf(s);
            break;
        case T::ButtonDown:
            if (kDpadButtons.count(ev.index)) {
                s.buttons.insert(ev.index);
                s.current = movementOf(s);
            } else if (auto it = kActionButtons.find(ev.index); it != kActionButtons.end()) {
                if (s.actionButtons.insert(ev.index).second) applyAction(s, it->second);
            }
            break;
        case T::ButtonUp:
            s.actionButtons.erase(ev.index);
            if (s.buttons.erase(ev.index)) s.current = movementOf(s);
            break;
        case T::SessionClosed:
            break;
    }
}

void ControlTranslator::send(const std::string &session, SessionState &s, const ControlCommand &cmd,
                             Clock::time_point now) {
    sink_.forward(session, cmd);
    s.lastSent = cmd;
    s.lastSentAt = now;
    if (isOneShot(cmd)) {
        // The keep-alive carries the movement state, not the action
        s.current = movementOf(s);
        s.lastSent = s.current;
    }
}

ControlTranslator::Clock::time_point ControlTranslator::service(const std::string &session, SessionState &s,
                                                                Clock::time_point now) {
    const auto minGap = std::chrono::milliseconds(opts_.minIntervalMs);
    const auto heartbeat = std::chrono::milliseconds(opts_.heartbeatMs);

    const bool changed = !s.lastSent || s.current != *s.lastSent;
    Clock::time_point due = changed ? (s.lastSent ? s.lastSentAt + minGap : now) : s.lastSentAt + heartbeat;
    if (now < due) return due;
    send(session, s, s.current, now);
    return now + heartbeat;
}

void ControlTranslator::workerLoop() {
    Clock::time_point nextWake = Clock::now() + std::chrono::milliseconds(opts_.heartbeatMs);
    for (;;) {
        std::deque<InputEvent> batch;
        bool stopping;
        {
            std::unique_lock<std::mutex> lk(qMtx_);
            qCv_.wait_until(lk, nextWake, [this] { return !queue_.empty() || !running_; });
            batch.swap(queue_);
            stopping = !running_;
        }

        for (auto &ev : batch) {
            if (ev.type == InputEvent::Type::SessionClosed) {
                auto it = sessions_.find(ev.session);
                if (it != sessions_.end()) {
                    sink_.forward(ev.session, ControlCommand::act(Action::Stop));
                    sessions_.erase(it);
                    std::cout << "[control] Session " << ev.session << " closed\n";
                }
                continue;
            }
            auto ins = sessions_.try_emplace(ev.session);
            if (ins.second) std::cout << "[control] Session " << ev.session << " opened\n";
            apply(ins.first->second, ev);
        }

        if (stopping) {
            for (auto &kv : sessions_) sink_.forward(kv.first, ControlCommand::act(Action::Stop));
            sessions_.clear();
            sessionCount_.store(0);
            return;
        }

        const auto now = Clock::now();
        nextWake = now + std::chrono::milliseconds(opts_.heartbeatMs);
        for (auto &kv : sessions_) {
            nextWake = std::min(nextWake, service(kv.first, kv.second, now));
        }
        sessionCount_.store(sessions_.size());
    }
}

} // namespace wifiproxy
