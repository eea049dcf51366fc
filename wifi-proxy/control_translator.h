#pragma once
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace wifiproxy {

enum class Action { Stop, Stand, Sit, LightsToggle };
const char *toString(Action a);

// Either a discrete action or a movement vector with both axes in [-1, 1]
struct ControlCommand {
    enum class Kind { Move, Action };

    Kind kind = Kind::Move;
    double dx = 0.0;
    double dy = 0.0;
    Action action = Action::Stop;

    static ControlCommand move(double dx, double dy);
    static ControlCommand act(Action a);
    bool isNeutral() const { return kind == Kind::Move && dx == 0.0 && dy == 0.0; }
    bool operator==(const ControlCommand &o) const;
    bool operator!=(const ControlCommand &o) const { return !(*this == o); }
};

struct InputEvent {
    enum class Type { KeyDown, KeyUp, AxisMove, ButtonDown, ButtonUp, SessionClosed };

    std::string session;
    Type type = Type::KeyDown;
    std::string code;           // KeyboardEvent.code
    int index = 0;              // gamepad axis/button index
    double value = 0.0;         // gamepad axis value

    // Browser messages:
    //   {"type":"keyboard","action":"down"|"up","code":"KeyW"}
    //   {"type":"gamepad","action":"axis","index":0,"value":-0.4}
    //   {"type":"gamepad","action":"down"|"up","index":12}
    // Returns nullopt for anything else.
    static std::optional<InputEvent> fromJson(const nlohmann::json &j, const std::string &session);
};

// Receives translated commands. Must not block.
class CommandSink {
public:
    virtual ~CommandSink() = default;
    virtual void forward(const std::string &session, const ControlCommand &cmd) = 0;
};

struct TranslatorOptions {
    int heartbeatMs = 250;
    int minIntervalMs = 50;
    size_t queueCapacity = 256;
    double deadzone = 0.15;
};

// Per-session input state to command translation with change detection,
// a send-rate floor and a keep-alive resend. Events are consumed on one worker thread.
class ControlTranslator {
public:
    explicit ControlTranslator(CommandSink &sink, TranslatorOptions opts = {});
    ~ControlTranslator();

    void start();
    // Forwards Stop for every open session, then joins the worker
    void stop();

    // Non-blocking. Returns false when the queue was full and an input was dropped.
    bool post(InputEvent ev);
    // Queued like input, but never dropped
    void closeSession(const std::string &session);

    uint64_t droppedEvents() const { return dropped_.load(); }
    size_t sessionCount() const;

private:
    using Clock = std::chrono::steady_clock;

    struct SessionState {
        std::set<std::string> keys;         // held movement keys
        std::set<std::string> actionKeys;   // held action keys (auto-repeat guard)
        std::set<int> buttons;              // held D-pad buttons
        std::set<int> actionButtons;
        double axisX = 0.0;
        double axisY = 0.0;
        ControlCommand current;
        std::optional<ControlCommand> lastSent;
        Clock::time_point lastSentAt{};
    };

    void workerLoop();
    // qMtx_ held; false when only session closes are queued
    bool dropOldestInputLocked();
    void apply(SessionState &s, const InputEvent &ev);
    void applyAction(SessionState &s, Action a);
    ControlCommand movementOf(const SessionState &s) const;
    // Sends when due; returns the next time this session needs attention
    Clock::time_point service(const std::string &session, SessionState &s, Clock::time_point now);
    void send(const std::string &session, SessionState &s, const ControlCommand &cmd, Clock::time_point now);
    double deadzone(double v) const;

    CommandSink &sink_;
    TranslatorOptions opts_;

    mutable std::mutex qMtx_;
    std::condition_variable qCv_;
    std::deque<InputEvent> queue_;
    bool running_ = false;
    std::atomic<uint64_t> dropped_{0};

    // worker thread only
    std::map<std::string, SessionState> sessions_;
    std::atomic<size_t> sessionCount_{0};

    std::thread worker_;
};

} // namespace wifiproxy
