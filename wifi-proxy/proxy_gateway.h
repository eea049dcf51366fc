#pragma once
#include "control_translator.h"
#include "gateway_client.h"
#include "route_table.h"
#include "stream_relay.h"
#include "subscriber_registry.h"
#include "thread_pool.h"

#include <uwebsockets/App.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace wifiproxy {

struct ProxyConfig {
    std::string bindHost = "0.0.0.0";
    int port = 8080;
    std::string webRoot = "web";
    std::string deviceControlPath = "/control";
    int sessionIdleMs = 3000;
    size_t workerThreads = 4;
    size_t maxPendingForwards = 256;
};

// Browser-facing HTTP/WebSocket server on the primary network
class ProxyGateway {
public:
    ProxyGateway(ProxyConfig cfg, GatewayClient &client, StreamRelay &relay, ControlTranslator &translator,
                 std::function<nlohmann::json()> statusProvider);
    ~ProxyGateway();

    // Runs the event loop on the calling thread until stop(). Returns false if the port could not be bound.
    bool run();
    // Thread-safe
    void stop();
    // Port actually listened on (cfg.port 0 picks one); 0 until listening
    int port() const { return boundPort_.load(); }

    // Thread-safe; pushes {"type":"info",...} to every control WebSocket
    void broadcastInfo(const nlohmann::json &obj);
    void setControlHealth(bool ok, const std::string &detail);

private:
    struct SocketData {
        std::string session;
        std::string peer;
        uint64_t subscriberId = 0;
    };
    using ControlSocket = uWS::WebSocket<false, true, SocketData>;
    using Response = uWS::HttpResponse<false>;

    struct StreamClient {
        std::shared_ptr<StreamSubscription> sub;
        Response *res = nullptr;
        std::string peer;
        uint64_t subscriberId = 0;
        bool aborted = false;
        bool started = false;
        bool finished = false;
        bool waitingWritable = false;
        std::atomic<bool> scheduled{false};
    };

    struct PendingRequest {
        Response *res = nullptr;
        std::string method;
        std::string target;
        HeaderList headers;
        std::string body;
        bool aborted = false;
    };

    void dispatch(Response *res, uWS::HttpRequest *req);
    void serveStatic(Response *res, const std::string &url);
    void handleStatus(Response *res);
    void handleStream(Response *res);
    void handleControlPost(Response *res, uWS::HttpRequest *req, const std::string &peer);
    void handlePassThrough(Response *res, uWS::HttpRequest *req, const std::string &method, const std::string &target);

    void scheduleStream(const std::shared_ptr<StreamClient> &sc);
    void pumpStream(const std::shared_ptr<StreamClient> &sc);
    void finishStream(const std::shared_ptr<StreamClient> &sc);
    void forwardAsync(const std::shared_ptr<PendingRequest> &ctx);
    size_t postEvents(const nlohmann::json &j, const std::string &session);

    void closeAll();
    void reaperLoop();
    void defer(std::function<void()> fn);

    ProxyConfig cfg_;
    GatewayClient &client_;
    StreamRelay &relay_;
    ControlTranslator &translator_;
    std::function<nlohmann::json()> statusProvider_;
    RouteTable routes_;
    SubscriberRegistry registry_;
    ThreadPool pool_;

    std::mutex loopMtx_;
    uWS::Loop *loop_ = nullptr;
    us_listen_socket_t *listenSocket_ = nullptr;

    // loop thread only
    std::map<uint64_t, std::shared_ptr<StreamClient>> streams_;
    std::set<ControlSocket*> sockets_;

    std::atomic<bool> stopping_{false};
    std::atomic<bool> controlHealthy_{true};
    std::atomic<uint64_t> wsSeq_{0};
    std::atomic<int> boundPort_{0};

    std::mutex reaperMtx_;
    std::condition_variable reaperCv_;
    std::thread reaper_;
};

} // namespace wifiproxy
