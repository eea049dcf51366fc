#include "minitest.h"
#include "test_support.h"
#include "control_translator.h"
#include "gateway_command_sink.h"

#include <chrono>
#include <thread>

using namespace wifiproxy;
using testutil::RecordingSink;
using testutil::waitUntil;
using json = nlohmann::json;

static TranslatorOptions fastOptions() {
    TranslatorOptions o;
    o.heartbeatMs = 100;
    o.minIntervalMs = 20;
    return o;
}

static InputEvent key(const std::string &session, const std::string &code, bool down) {
    InputEvent ev;
    ev.session = session;
    ev.type = down ? InputEvent::Type::KeyDown : InputEvent::Type::KeyUp;
    ev.code = code;
    return ev;
}

static InputEvent button(const std::string &session, int index, bool down) {
    InputEvent ev;
    ev.session = session;
    ev.type = down ? InputEvent::Type::ButtonDown : InputEvent::Type::ButtonUp;
    ev.index = index;
    return ev;
}

static InputEvent axis(const std::string &session, int index, double value) {
    InputEvent ev;
    ev.session = session;
    ev.type = InputEvent::Type::AxisMove;
    ev.index = index;
    ev.value = value;
    return ev;
}

static size_t countOf(const std::vector<ControlCommand> &cmds, const ControlCommand &c) {
    size_t n = 0;
    for (auto &x : cmds) if (x == c) ++n;
    return n;
}

TEST(translator_forward_key_moves_forward) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyW", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(0, 1)); }, 1000));
    tr.stop();
}

TEST(translator_combined_keys_move_diagonally) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyW", true));
    tr.post(key("s1", "KeyA", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(-1, 1)); }, 1000));
    tr.stop();
}

TEST(translator_release_reaches_neutral_within_heartbeat) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "ArrowUp", true));
    tr.post(key("s1", "ArrowRight", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(1, 1)); }, 1000));

    auto released = std::chrono::steady_clock::now();
    tr.post(key("s1", "ArrowUp", false));
    tr.post(key("s1", "ArrowRight", false));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(0, 0)); }, 1000));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - released);
    // heartbeat plus scheduling slack
    ASSERT_TRUE(elapsed.count() < 100 + 80);
    tr.stop();
}

TEST(translator_heartbeat_repeats_held_state) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyW", true));
    std::this_thread::sleep_for(std::chrono::milliseconds(450));
    size_t n = countOf(sink.commandsFor("s1"), ControlCommand::move(0, 1));
    tr.stop();
    ASSERT_TRUE(n >= 3);
    ASSERT_TRUE(n <= 7);
}

TEST(translator_axis_burst_is_coalesced) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(axis("pad", 0, 0.3));
    ASSERT_TRUE(waitUntil([&] { return sink.size() >= 1; }, 1000));
    for (int i = 1; i <= 50; ++i) tr.post(axis("pad", 0, 0.3 + i * 0.014));
    ASSERT_TRUE(waitUntil([&] {
        auto c = sink.commandsFor("pad");
        return !c.empty() && c.back() == ControlCommand::move(1, 0);
    }, 1000));
    tr.stop();
    // 50 changes inside a few milliseconds may not become 50 commands
    ASSERT_TRUE(sink.commandsFor("pad").size() < 20);
}

TEST(translator_axis_deadzone_and_inversion) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(axis("pad", 0, 0.1));
    tr.post(axis("pad", 1, -1.0));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("pad", ControlCommand::move(0, 1)); }, 1000));
    tr.stop();
}

TEST(translator_action_is_one_shot) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyE", true));
    tr.post(key("s1", "KeyE", true));   // auto-repeat
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto cmds = sink.commandsFor("s1");
    ASSERT_EQ(countOf(cmds, ControlCommand::act(Action::Stand)), 1u);
    ASSERT_TRUE(cmds.back() == ControlCommand::move(0, 0));

    tr.post(key("s1", "KeyE", false));
    tr.post(key("s1", "KeyE", true));
    ASSERT_TRUE(waitUntil([&] {
        return countOf(sink.commandsFor("s1"), ControlCommand::act(Action::Stand)) == 2;
    }, 1000));
    tr.stop();
}

TEST(translator_stop_overrides_held_movement) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyW", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(0, 1)); }, 1000));
    tr.post(key("s1", "Space", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::act(Action::Stop)); }, 1000));
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    auto cmds = sink.commandsFor("s1");
    ASSERT_TRUE(cmds.back() == ControlCommand::act(Action::Stop));
    tr.stop();
}

TEST(translator_gamepad_buttons) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(button("pad", 15, true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("pad", ControlCommand::move(1, 0)); }, 1000));
    tr.post(button("pad", 2, true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("pad", ControlCommand::act(Action::Sit)); }, 1000));
    tr.post(button("pad", 3, true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("pad", ControlCommand::act(Action::LightsToggle)); }, 1000));
    tr.stop();
}

TEST(translator_sessions_are_independent) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("a", "KeyW", true));
    tr.post(key("b", "KeyS", true));
    ASSERT_TRUE(waitUntil([&] {
        return sink.sawFor("a", ControlCommand::move(0, 1)) && sink.sawFor("b", ControlCommand::move(0, -1));
    }, 1000));
    ASSERT_TRUE(!sink.sawFor("a", ControlCommand::move(0, -1)));
    ASSERT_TRUE(waitUntil([&] { return tr.sessionCount() == 2; }, 1000));
    tr.stop();
}

TEST(translator_session_close_sends_stop) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("s1", "KeyD", true));
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::move(1, 0)); }, 1000));
    tr.closeSession("s1");
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::act(Action::Stop)); }, 1000));
    ASSERT_TRUE(waitUntil([&] { return tr.sessionCount() == 0; }, 1000));

    size_t before = sink.commandsFor("s1").size();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    ASSERT_EQ(sink.commandsFor("s1").size(), before);
    tr.stop();
}

TEST(translator_stop_halts_every_session) {
    RecordingSink sink;
    ControlTranslator tr(sink, fastOptions());
    tr.start();
    tr.post(key("a", "KeyW", true));
    tr.post(key("b", "KeyA", true));
    ASSERT_TRUE(waitUntil([&] { return tr.sessionCount() == 2; }, 1000));
    tr.stop();
    ASSERT_TRUE(sink.commandsFor("a").back() == ControlCommand::act(Action::Stop));
    ASSERT_TRUE(sink.commandsFor("b").back() == ControlCommand::act(Action::Stop));
}

TEST(translator_full_queue_drops_oldest) {
    RecordingSink sink;
    TranslatorOptions o = fastOptions();
    o.queueCapacity = 4;
    ControlTranslator tr(sink, o);
    int accepted = 0;
    for (int i = 0; i < 6; ++i) {
        if (tr.post(key("s1", i % 2 ? "KeyW" : "KeyS", true))) ++accepted;
    }
    ASSERT_EQ(accepted, 4);
    ASSERT_EQ(tr.droppedEvents(), 2u);
}

TEST(translator_close_on_full_queue_displaces_input) {
    RecordingSink sink;
    TranslatorOptions o = fastOptions();
    o.queueCapacity = 4;
    ControlTranslator tr(sink, o);
    for (int i = 0; i < 4; ++i) ASSERT_TRUE(tr.post(key("s1", "KeyW", i % 2 == 0)));

    tr.closeSession("s1");
    ASSERT_EQ(tr.droppedEvents(), 1u);
    tr.closeSession("s2");
    ASSERT_EQ(tr.droppedEvents(), 2u);

    tr.start();
    ASSERT_TRUE(waitUntil([&] { return sink.sawFor("s1", ControlCommand::act(Action::Stop)); }, 1000));
    ASSERT_TRUE(waitUntil([&] { return tr.sessionCount() == 0; }, 1000));
    tr.stop();
}

TEST(translator_queue_of_closes_rejects_input) {
    RecordingSink sink;
    TranslatorOptions o = fastOptions();
    o.queueCapacity = 2;
    ControlTranslator tr(sink, o);
    tr.closeSession("a");
    tr.closeSession("b");
    ASSERT_TRUE(!tr.post(key("c", "KeyW", true)));
    ASSERT_EQ(tr.droppedEvents(), 1u);
}

TEST(translator_parses_browser_messages) {
    auto k = InputEvent::fromJson(json{{"type", "keyboard"}, {"action", "down"}, {"code", "KeyW"}}, "s");
    ASSERT_TRUE(k.has_value());
    ASSERT_TRUE(k->type == InputEvent::Type::KeyDown);
    ASSERT_EQ(k->code, "KeyW");
    ASSERT_EQ(k->session, "s");

    auto a = InputEvent::fromJson(json{{"type", "gamepad"}, {"action", "axis"}, {"index", 1}, {"value", -0.5}}, "s");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(a->type == InputEvent::Type::AxisMove);
    ASSERT_NEAR(a->value, -0.5, 1e-9);

    auto b = InputEvent::fromJson(json{{"type", "gamepad"}, {"action", "up"}, {"index", 12}}, "s");
    ASSERT_TRUE(b && b->type == InputEvent::Type::ButtonUp && b->index == 12);

    ASSERT_TRUE(!InputEvent::fromJson(json{{"type", "mouse"}}, "s"));
    ASSERT_TRUE(!InputEvent::fromJson(json{{"type", "keyboard"}, {"action", "down"}}, "s"));
    ASSERT_TRUE(!InputEvent::fromJson(json::array(), "s"));
}

TEST(translator_command_clamps_axes) {
    ControlCommand c = ControlCommand::move(-3.0, 2.0);
    ASSERT_NEAR(c.dx, -1.0, 1e-9);
    ASSERT_NEAR(c.dy, 1.0, 1e-9);
    ASSERT_TRUE(ControlCommand::move(0, 0).isNeutral());
    ASSERT_TRUE(!ControlCommand::act(Action::Stop).isNeutral());
}

TEST(sink_device_json_matches_firmware) {
    json mv = GatewayCommandSink::toDeviceJson(ControlCommand::move(-1.0, 0.5));
    ASSERT_EQ(mv["type"], "xy");
    ASSERT_EQ(mv["x"], -255);
    ASSERT_EQ(mv["y"], 128);
    ASSERT_EQ(GatewayCommandSink::toDeviceJson(ControlCommand::act(Action::Stop)).dump(), "{\"type\":\"stop\"}");
    json act = GatewayCommandSink::toDeviceJson(ControlCommand::act(Action::LightsToggle));
    ASSERT_EQ(act["type"], "action");
    ASSERT_EQ(act["action"], "lights");
}

TEST(sink_keeps_only_latest_per_session) {
    testutil::TestHttpServer srv([](int fd, const testutil::TestHttpServer::Request &) {
        testutil::writeAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nOK");
    });
    GatewayEndpoint ep;
    ep.host = "127.0.0.1";
    ep.httpPort = srv.port();
    ep.bindAddress = "127.0.0.1";
    GatewayClient client(ep);
    GatewayCommandSink sink(client, "/control");

    // Queued before the worker runs: the first two are superseded
    sink.forward("s1", ControlCommand::move(0, 1));
    sink.forward("s1", ControlCommand::move(0, 0.5));
    sink.forward("s2", ControlCommand::act(Action::Sit));
    sink.forward("s1", ControlCommand::act(Action::Stop));
    sink.start();
    ASSERT_TRUE(waitUntil([&] { return sink.delivered() == 2; }, 2000));
    sink.stop();

    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 2u);
    ASSERT_EQ(json::parse(reqs[0].body)["type"], "stop");
    ASSERT_EQ(json::parse(reqs[1].body)["action"], "sit");
}

TEST(sink_reports_health_transitions) {
    int port;
    {
        testutil::TestHttpServer srv([](int, const testutil::TestHttpServer::Request &) {});
        port = srv.port();
    }
    GatewayEndpoint ep;
    ep.host = "127.0.0.1";
    ep.httpPort = port;
    ep.bindAddress = "127.0.0.1";
    GatewayOptions opts;
    opts.connectTimeoutMs = 200;
    GatewayClient client(ep, opts);
    GatewayCommandSink sink(client, "/control");

    std::mutex mx;
    std::vector<bool> health;
    sink.setHealthCallback([&](bool ok, const std::string &) {
        std::lock_guard<std::mutex> lk(mx);
        health.push_back(ok);
    });
    sink.start();
    sink.forward("s1", ControlCommand::act(Action::Stop));
    sink.forward("s2", ControlCommand::act(Action::Stop));
    ASSERT_TRUE(waitUntil([&] { return sink.failed() == 2; }, 3000));
    sink.stop();
    std::lock_guard<std::mutex> lk(mx);
    ASSERT_EQ(health.size(), 1u);
    ASSERT_EQ(health[0], false);
}
