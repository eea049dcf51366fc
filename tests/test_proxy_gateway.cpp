#include "minitest.h"
#include "test_support.h"
#include "proxy_gateway.h"

#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>

using namespace wifiproxy;
using testutil::RecordingSink;
using testutil::ScriptedSource;
using testutil::SourcePlan;
using testutil::SourceScript;
using testutil::TestHttpServer;
using testutil::waitUntil;
using testutil::writeAll;
using json = nlohmann::json;

namespace {

// Port that refused connections a moment ago
int closedPort() {
    TestHttpServer srv([](int, const TestHttpServer::Request &) {});
    return srv.port();
}

// Gateway on an ephemeral loopback port, its event loop on a thread of its own
struct RunningGateway {
    SourceScript script;
    RecordingSink sink;
    std::unique_ptr<GatewayClient> client;
    std::unique_ptr<StreamRelay> relay;
    std::unique_ptr<ControlTranslator> translator;
    std::unique_ptr<ProxyGateway> gw;
    std::thread loop;
    std::atomic<bool> ran{false};

    explicit RunningGateway(int devicePort, int sessionIdleMs = 3000) {
        GatewayEndpoint ep;
        ep.host = "127.0.0.1";
        ep.httpPort = devicePort;
        ep.bindAddress = "127.0.0.1";
        GatewayOptions gopts;
        gopts.connectTimeoutMs = 300;
        gopts.readTimeoutMs = 1000;
        gopts.maxAttempts = 1;
        client = std::make_unique<GatewayClient>(ep, gopts);

        RelayOptions ropts;
        ropts.bufferFrames = 3;
        ropts.maxReconnects = 1;
        ropts.retryBaseMs = 5;
        ropts.retryMaxMs = 10;
        relay = std::make_unique<StreamRelay>([this]() -> std::unique_ptr<FrameSource> {
            return std::make_unique<ScriptedSource>(script);
        }, ropts);

        TranslatorOptions topts;
        topts.heartbeatMs = 100;
        topts.minIntervalMs = 20;
        translator = std::make_unique<ControlTranslator>(sink, topts);
        translator->start();

        ProxyConfig cfg;
        cfg.bindHost = "127.0.0.1";
        cfg.port = 0;
        cfg.sessionIdleMs = sessionIdleMs;
        cfg.workerThreads = 2;
        gw = std::make_unique<ProxyGateway>(cfg, *client, *relay, *translator, []() { return json::object(); });
        loop = std::thread([this] { ran.store(gw->run()); });
        if (!waitUntil([this] { return gw->port() != 0; }, 2000)) {
            shutdown();
            throw std::runtime_error("gateway did not start listening");
        }
    }

    ~RunningGateway() { shutdown(); }

    void shutdown() {
        if (loop.joinable()) {
            gw->stop();
            loop.join();
        }
        translator->stop();
        relay->shutdown();
    }

    int port() const { return gw->port(); }
};

int connectTo(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    timeval tv{3, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr; std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        throw std::runtime_error("connect to gateway failed");
    }
    return fd;
}

// Reads until needle shows up; false on EOF or timeout first
bool readUntil(int fd, std::string &acc, const std::string &needle) {
    char buf[4096];
    while (acc.find(needle) == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        acc.append(buf, (size_t)n);
    }
    return true;
}

// True when the peer closed the connection before the receive timeout
bool readToEof(int fd, std::string &acc) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            acc.append(buf, (size_t)n);
            continue;
        }
        return n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK);
    }
}

std::string exchange(int port, const std::string &request) {
    int fd = connectTo(port);
    writeAll(fd, request);
    std::string raw;
    readToEof(fd, raw);
    ::close(fd);
    return raw;
}

std::string get(int port, const std::string &target) {
    return exchange(port, "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n");
}

std::string postJson(int port, const std::string &target, const std::string &body, const std::string &extra = "") {
    return exchange(port, "POST " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n" +
                              extra + "Content-Length: " + std::to_string(body.size()) +
                              "\r\nConnection: close\r\n\r\n" + body);
}

int statusOf(const std::string &raw) {
    if (raw.compare(0, 5, "HTTP/") != 0 || raw.size() < 12) return 0;
    return std::atoi(raw.c_str() + 9);
}

std::string bodyOf(const std::string &raw) {
    size_t p = raw.find("\r\n\r\n");
    return p == std::string::npos ? std::string() : raw.substr(p + 4);
}

bool hasHeader(const std::string &raw, const std::string &line) {
    return raw.substr(0, raw.find("\r\n\r\n")).find(line) != std::string::npos;
}

std::string keyEvent(const std::string &code, const std::string &action) {
    return json{{"type", "keyboard"}, {"code", code}, {"action", action}}.dump();
}

} // namespace

TEST(proxy_pass_through_relays_device_response) {
    TestHttpServer device([](int fd, const TestHttpServer::Request &) {
        writeAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 7\r\n\r\nfw 1.4\n");
    });
    RunningGateway g(device.port());
    std::string raw = get(g.port(), "/info?verbose=1");
    ASSERT_EQ(statusOf(raw), 200);
    ASSERT_EQ(bodyOf(raw), "fw 1.4\n");
    auto reqs = device.requests();
    ASSERT_EQ(reqs.size(), 1u);
    ASSERT_TRUE(reqs[0].head.rfind("GET /info?verbose=1 HTTP/1.1", 0) == 0);
}

TEST(proxy_pass_through_unreachable_is_502_with_retry_after) {
    RunningGateway g(closedPort());
    std::string raw = get(g.port(), "/settings");
    ASSERT_EQ(statusOf(raw), 502);
    ASSERT_TRUE(hasHeader(raw, "Retry-After: 2"));
    ASSERT_EQ(json::parse(bodyOf(raw))["error"], "gateway_unreachable");
}

TEST(proxy_stream_fails_with_502_before_first_frame) {
    RunningGateway g(closedPort());
    g.script.fallback.failOpen = true;
    std::string raw = get(g.port(), "/stream");
    ASSERT_EQ(statusOf(raw), 502);
    ASSERT_TRUE(hasHeader(raw, "Retry-After: 5"));
    ASSERT_TRUE(bodyOf(raw).find("gateway_unreachable") != std::string::npos);
    ASSERT_TRUE(waitUntil([&] { return g.relay->stats().subscribers == 0; }, 1000));
}

TEST(proxy_running_stream_ends_with_error_part) {
    RunningGateway g(closedPort());
    {
        std::lock_guard<std::mutex> lk(g.script.mtx);
        SourcePlan first;
        first.frames = 2;
        first.endWithError = true;
        g.script.plans.push_back(first);
        g.script.fallback.failOpen = true;
    }
    std::string raw = get(g.port(), "/stream");
    ASSERT_EQ(statusOf(raw), 200);
    ASSERT_TRUE(hasHeader(raw, "multipart/x-mixed-replace; boundary=frame"));
    const std::string body = bodyOf(raw);
    const size_t frame = body.find("frame-1");
    const size_t err = body.find("\"error\":\"gateway_unreachable\"");
    ASSERT_TRUE(frame != std::string::npos);
    ASSERT_TRUE(err != std::string::npos);
    ASSERT_TRUE(frame < err);
    ASSERT_TRUE(body.find("--frame--", err) != std::string::npos);
}

TEST(proxy_control_post_resolves_session) {
    RunningGateway g(closedPort());

    std::string raw = postJson(g.port(), "/control", keyEvent("KeyD", "down"), "X-Session-Id: tab-7\r\n");
    ASSERT_EQ(statusOf(raw), 200);
    json reply = json::parse(bodyOf(raw));
    ASSERT_EQ(reply["ok"], true);
    ASSERT_EQ(reply["accepted"], 1);
    ASSERT_EQ(reply["session"], "tab-7");

    raw = postJson(g.port(), "/control?session=q-1", "[" + keyEvent("KeyD", "down") + "," + keyEvent("KeyD", "up") + "]");
    reply = json::parse(bodyOf(raw));
    ASSERT_EQ(reply["session"], "q-1");
    ASSERT_EQ(reply["accepted"], 2);

    raw = postJson(g.port(), "/control", keyEvent("KeyA", "down"));
    reply = json::parse(bodyOf(raw));
    const std::string fallback = reply["session"].get<std::string>();
    ASSERT_TRUE(fallback.rfind("http-", 0) == 0);

    ASSERT_TRUE(waitUntil([&] { return g.sink.sawFor("tab-7", ControlCommand::move(1, 0)); }, 1000));
    ASSERT_TRUE(waitUntil([&] { return g.sink.sawFor(fallback, ControlCommand::move(-1, 0)); }, 1000));
    ASSERT_TRUE(waitUntil([&] { return !g.sink.commandsFor("q-1").empty(); }, 1000));

    raw = postJson(g.port(), "/control", "{not json");
    ASSERT_EQ(statusOf(raw), 400);
}

TEST(proxy_idle_http_session_is_stopped) {
    RunningGateway g(closedPort(), 300);
    std::string raw = postJson(g.port(), "/control", keyEvent("KeyD", "down"), "X-Session-Id: idle-1\r\n");
    ASSERT_EQ(statusOf(raw), 200);
    ASSERT_TRUE(waitUntil([&] { return g.sink.sawFor("idle-1", ControlCommand::move(1, 0)); }, 1000));

    ASSERT_TRUE(waitUntil([&] { return g.sink.sawFor("idle-1", ControlCommand::act(Action::Stop)); }, 2000));
    ASSERT_TRUE(waitUntil([&] { return g.translator->sessionCount() == 0; }, 1000));
    ASSERT_TRUE(g.sink.commandsFor("idle-1").back() == ControlCommand::act(Action::Stop));
}

TEST(proxy_stop_closes_subscribers_and_upstream) {
    RunningGateway g(closedPort());
    g.script.fallback.frames = 1;
    g.script.fallback.block = true;

    int a = connectTo(g.port());
    int b = connectTo(g.port());
    const std::string req = "GET /stream HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
    writeAll(a, req);
    writeAll(b, req);
    std::string accA, accB;
    ASSERT_TRUE(readUntil(a, accA, "frame-1"));
    ASSERT_TRUE(readUntil(b, accB, "frame-1"));
    ASSERT_EQ(g.relay->stats().subscribers, 2u);
    ASSERT_EQ(g.script.live.load(), 1);

    g.gw->stop();
    g.loop.join();
    ASSERT_TRUE(g.ran.load());
    ASSERT_TRUE(readToEof(a, accA));
    ASSERT_TRUE(readToEof(b, accB));
    ::close(a);
    ::close(b);
    ASSERT_EQ(g.relay->stats().subscribers, 0u);
    ASSERT_TRUE(waitUntil([&] { return g.script.live.load() == 0; }, 1000));
}
