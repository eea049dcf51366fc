#include "proxy_gateway.h"
#include "errors.h"
#include "net_util.h"

#include <cctype>
#include <chrono>
#include <iostream>

using json = nlohmann::json;

namespace wifiproxy {

static const size_t kMaxControlBody = 64 * 1024;
static const size_t kMaxForwardBody = 4 * 1024 * 1024;

static std::string toUpper(std::string s) {
    for (auto &c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

static std::string contentTypeFor(const std::string &path) {
    auto ends = [&](const char *ext) {
        std::string e(ext);
        return path.size() >= e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0;
    };
    if (ends(".html")) return "text/html; charset=utf-8";
    if (ends(".js")) return "application/javascript";
    if (ends(".css")) return "text/css";
    if (ends(".json")) return "application/json";
    if (ends(".png")) return "image/png";
    if (ends(".ico")) return "image/x-icon";
    if (ends(".svg")) return "image/svg+xml";
    if (ends(".jpg") || ends(".jpeg")) return "image/jpeg";
    return "application/octet-stream";
}

// Hop-by-hop and framing headers are regenerated by uWS
static bool isHopByHop(const std::string &name) {
    const std::string n = toLower(name);
    return n == "connection" || n == "keep-alive" || n == "transfer-encoding" || n == "content-length" ||
           n == "upgrade" || n == "proxy-connection" || n == "te" || n == "trailer";
}

template <typename Res>
static void writeCors(Res *res) {
    res->writeHeader("Access-Control-Allow-Origin", "*");
}

template <typename Res>
static void endJson(Res *res, const char *status, const json &body) {
    res->writeStatus(status);
    writeCors(res);
    res->writeHeader("Content-Type", "application/json");
    res->end(body.dump());
}

ProxyGateway::ProxyGateway(ProxyConfig cfg, GatewayClient &client, StreamRelay &relay, ControlTranslator &translator,
                           std::function<json()> statusProvider)
    : cfg_(std::move(cfg)), client_(client), relay_(relay), translator_(translator),
      statusProvider_(std::move(statusProvider)), routes_(RouteTable::defaults()), pool_(cfg_.workerThreads, cfg_.maxPendingForwards) {}

ProxyGateway::~ProxyGateway() {
    stopping_.store(true);
    reaperCv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
    pool_.shutdown();
}

void ProxyGateway::defer(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(loopMtx_);
    if (loop_) loop_->defer(std::move(fn));
}

// --------------- Broadcasting (run on loop) ---------------
void ProxyGateway::broadcastInfo(const json &obj) {
    json out = json::object();
    out["type"] = "info";
    for (auto it = obj.begin(); it != obj.end(); ++it) out[it.key()] = it.value();
    std::string s = out.dump();
    defer([this, s = std::move(s)]() {
        for (auto *ws : sockets_) ws->send(s, uWS::OpCode::TEXT);
    });
}

void ProxyGateway::setControlHealth(bool ok, const std::string &detail) {
    controlHealthy_.store(ok);
    json info = { {"controlConnected", ok} };
    if (!detail.empty()) info["error"] = detail;
    broadcastInfo(info);
}

// --------------- Routing ---------------
void ProxyGateway::dispatch(Response *res, uWS::HttpRequest *req) {
    const std::string url(req->getUrl());
    const std::string query(req->getQuery());
    const std::string method = toUpper(std::string(req->getMethod()));
    const std::string peer(res->getRemoteAddressAsText());

    if (method == "OPTIONS") {
        res->writeStatus("204 No Content");
        writeCors(res);
        res->writeHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res->writeHeader("Access-Control-Allow-Headers", "Content-Type, X-Session-Id");
        res->end();
        return;
    }

    switch (routes_.match(url)) {
        case RouteKind::Static:
            serveStatic(res, url);
            return;
        case RouteKind::Status:
            handleStatus(res);
            return;
        case RouteKind::Stream:
            if (method != "GET") {
                endJson(res, "405 Method Not Allowed", json{{"error", "method_not_allowed"}});
                return;
            }
            handleStream(res);
            return;
        case RouteKind::Control:
            if (method == "POST") {
                handleControlPost(res, req, peer);
            } else if (method == "GET" && !query.empty()) {
                // Query-string commands go to the device as they are
                handlePassThrough(res, req, method, cfg_.deviceControlPath + "?" + query);
            } else {
                endJson(res, "405 Method Not Allowed", json{{"error", "method_not_allowed"}});
            }
            return;
        case RouteKind::ControlSocket:
            endJson(res, "426 Upgrade Required", json{{"error", "websocket_required"}});
            return;
        case RouteKind::PassThrough:
            handlePassThrough(res, req, method, query.empty() ? url : url + "?" + query);
            return;
    }
}

void ProxyGateway::serveStatic(Response *res, const std::string &url) {
    const std::string rel = (url == "/") ? "/index.html" : url;
    std::string body;
    if (rel.find("..") != std::string::npos ||
        (!readFileToString(cfg_.webRoot + rel, body) && !readFileToString("web" + rel, body))) {
        res->writeStatus("404 Not Found")->end("Not found");
        return;
    }
    res->writeHeader("Content-Type", contentTypeFor(rel))->writeHeader("Cache-Control", "no-cache")->end(body);
}

void ProxyGateway::handleStatus(Response *res) {
    json j = statusProvider_ ? statusProvider_() : json::object();
    RelayStats rs = relay_.stats();
    j["relay"] = {
        {"upstreamConnected", rs.upstreamConnected},
        {"upstreamOpens", rs.upstreamOpens},
        {"framesRelayed", rs.framesRelayed},
        {"subscribers", rs.subscribers}
    };
    j["control"] = {
        {"connected", controlHealthy_.load()},
        {"sessions", translator_.sessionCount()},
        {"droppedEvents", translator_.droppedEvents()}
    };
    json subs = json::array();
    const auto now = std::chrono::steady_clock::now();
    for (auto &s : registry_.snapshot()) {
        subs.push_back({
            {"id", s.id},
            {"kind", toString(s.kind)},
            {"session", s.session},
            {"peer", s.peer},
            {"idleMs", std::chrono::duration_cast<std::chrono::milliseconds>(now - s.lastSeen).count()}
        });
    }
    j["subscribers"] = std::move(subs);
    endJson(res, "200 OK", j);
}

// --------------- /stream ---------------
void ProxyGateway::handleStream(Response *res) {
    if (stopping_.load()) {
        endJson(res, "503 Service Unavailable", json{{"error", "shutting_down"}});
        return;
    }
    std::shared_ptr<StreamSubscription> sub;
    try {
        sub = relay_.subscribe();
    } catch (const ProxyError &e) {
        endJson(res, "503 Service Unavailable", json{{"error", "shutting_down"}, {"detail", e.what()}});
        return;
    }

    auto sc = std::make_shared<StreamClient>();
    sc->sub = sub;
    sc->res = res;
    sc->peer = std::string(res->getRemoteAddressAsText());
    sc->subscriberId = registry_.add(ProxySubscriber::Kind::Stream, sc->peer, "", true);
    streams_[sub->id()] = sc;

    res->onAborted([this, sc]() {
        sc->aborted = true;
        finishStream(sc);
    });
    sub->setNotify([this, sc]() { scheduleStream(sc); });

    std::cout << "[proxy] Stream client " << sc->peer << " attached. Streaming: " << streams_.size() << "\n";
    scheduleStream(sc);
}

void ProxyGateway::scheduleStream(const std::shared_ptr<StreamClient> &sc) {
    if (sc->scheduled.exchange(true)) return;
    defer([this, sc]() {
        sc->scheduled.store(false);
        pumpStream(sc);
    });
}

void ProxyGateway::pumpStream(const std::shared_ptr<StreamClient> &sc) {
    if (sc->aborted || sc->finished || sc->waitingWritable) return;
    Response *res = sc->res;

    FramePtr f;
    while (sc->sub->tryPop(f)) {
        if (!sc->started) {
            res->writeStatus("200 OK");
            writeCors(res);
            res->writeHeader("Content-Type", "multipart/x-mixed-replace; boundary=frame");
            res->writeHeader("Cache-Control", "no-cache, no-store, must-revalidate");
            res->writeHeader("Pragma", "no-cache");
            sc->started = true;
        }
        std::string part;
        part.reserve(f->payload.size() + 128);
        part += "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: ";
        part += std::to_string(f->payload.size());
        part += "\r\nX-Sequence: ";
        part += std::to_string(f->seq);
        part += "\r\n\r\n";
        part += f->payload;
        part += "\r\n";
        registry_.touch(sc->subscriberId);
        if (!res->write(part)) {
            // Socket is backed up; frames keep dropping in the subscription meanwhile
            sc->waitingWritable = true;
            res->onWritable([this, sc](uintmax_t) {
                sc->waitingWritable = false;
                pumpStream(sc);
                return true;
            });
            return;
        }
    }

    const auto st = sc->sub->state();
    if (st == StreamSubscription::State::Failed) {
        json err = { {"error", "gateway_unreachable"}, {"detail", sc->sub->failureReason()} };
        if (!sc->started) {
            res->writeStatus("502 Bad Gateway");
            writeCors(res);
            res->writeHeader("Retry-After", "5");
            res->writeHeader("Content-Type", "application/json");
            res->end(err.dump());
        } else {
            res->write("--frame\r\nContent-Type: application/json\r\n\r\n" + err.dump() + "\r\n--frame--\r\n");
            res->end();
        }
        std::cerr << "[proxy] Stream to " << sc->peer << " failed: " << sc->sub->failureReason() << "\n";
        finishStream(sc);
    } else if (st == StreamSubscription::State::Closed) {
        if (sc->started) res->end();
        else endJson(res, "503 Service Unavailable", json{{"error", "stream_closed"}});
        finishStream(sc);
    }
}

void ProxyGateway::finishStream(const std::shared_ptr<StreamClient> &sc) {
    if (sc->finished) return;
    sc->finished = true;
    sc->sub->setNotify(nullptr);
    relay_.unsubscribe(sc->sub->id());
    registry_.remove(sc->subscriberId);
    streams_.erase(sc->sub->id());
    std::cout << "[proxy] Stream client " << sc->peer << " detached. Streaming: " << streams_.size()
              << " dropped frames: " << sc->sub->dropped() << "\n";
}

// --------------- /control ---------------
size_t ProxyGateway::postEvents(const json &j, const std::string &session) {
    size_t accepted = 0;
    auto one = [&](const json &e) {
        if (auto ev = InputEvent::fromJson(e, session)) {
            translator_.post(std::move(*ev));
            ++accepted;
        }
    };
    if (j.is_array()) {
        for (auto &e : j) one(e);
    } else {
        one(j);
    }
    return accepted;
}

void ProxyGateway::handleControlPost(Response *res, uWS::HttpRequest *req, const std::string &peer) {
    std::string session(req->getHeader("x-session-id"));
    if (session.empty()) session = std::string(req->getQuery("session"));
    if (session.empty()) session = "http-" + peer;

    auto body = std::make_shared<std::string>();
    auto aborted = std::make_shared<bool>(false);
    res->onAborted([aborted]() { *aborted = true; });
    res->onData([this, res, body, aborted, session, peer](std::string_view chunk, bool isLast) {
        if (body->size() + chunk.size() <= kMaxControlBody) body->append(chunk.data(), chunk.size());
        else body->assign(kMaxControlBody + 1, ' ');
        if (!isLast || *aborted) return;

        if (body->size() > kMaxControlBody) {
            endJson(res, "413 Payload Too Large", json{{"error", "body_too_large"}});
            return;
        }
        json j;
        try {
            j = json::parse(*body);
        } catch (const json::exception &e) {
            endJson(res, "400 Bad Request", json{{"error", "bad_json"}, {"detail", e.what()}});
            return;
        }
        registry_.touchSession(session, peer);
        size_t n = postEvents(j, session);
        endJson(res, "200 OK", json{{"ok", true}, {"accepted", n}, {"session", session}});
    });
}

// --------------- pass-through ---------------
void ProxyGateway::handlePassThrough(Response *res, uWS::HttpRequest *req, const std::string &method,
                                     const std::string &target) {
    auto ctx = std::make_shared<PendingRequest>();
    ctx->res = res;
    ctx->method = method;
    ctx->target = target;
    for (const char *h : {"content-type", "accept", "authorization"}) {
        std::string v(req->getHeader(h));
        if (!v.empty()) ctx->headers.emplace_back(h, v);
    }
    res->onAborted([ctx]() { ctx->aborted = true; });

    const std::string cl(req->getHeader("content-length"));
    const bool hasBody = (!cl.empty() && cl != "0") || !req->getHeader("transfer-encoding").empty();
    if (!hasBody) {
        forwardAsync(ctx);
        return;
    }
    res->onData([this, ctx](std::string_view chunk, bool isLast) {
        if (ctx->body.size() + chunk.size() > kMaxForwardBody) {
            if (isLast && !ctx->aborted) endJson(ctx->res, "413 Payload Too Large", json{{"error", "body_too_large"}});
            ctx->aborted = ctx->aborted || isLast;
            return;
        }
        ctx->body.append(chunk.data(), chunk.size());
        if (isLast) forwardAsync(ctx);
    });
}

void ProxyGateway::forwardAsync(const std::shared_ptr<PendingRequest> &ctx) {
    bool queued = pool_.enqueue([this, ctx]() {
        auto r = std::make_shared<HttpResponse>();
        std::string err;
        try {
            *r = client_.request(ctx->method, ctx->target, ctx->body, ctx->headers);
        } catch (const GatewayUnreachable &e) {
            err = e.what();
        }
        defer([ctx, r, err]() {
            if (ctx->aborted) return;
            Response *res = ctx->res;
            if (!err.empty()) {
                std::cerr << "[proxy] " << ctx->method << " " << ctx->target << ": " << err << "\n";
                res->writeStatus("502 Bad Gateway");
                writeCors(res);
                res->writeHeader("Retry-After", "2");
                res->writeHeader("Content-Type", "application/json");
                res->end(json{{"error", "gateway_unreachable"}, {"detail", err}}.dump());
                return;
            }
            res->writeStatus(std::to_string(r->status) + " " + (r->reason.empty() ? std::string("OK") : r->reason));
            for (auto &h : r->headers) {
                if (!isHopByHop(h.first)) res->writeHeader(h.first, h.second);
            }
            res->end(r->body);
        });
    });
    if (!queued && !ctx->aborted) {
        endJson(ctx->res, "503 Service Unavailable", json{{"error", stopping_.load() ? "shutting_down" : "busy"}});
    }
}

// --------------- lifecycle ---------------
void ProxyGateway::reaperLoop() {
    while (!stopping_.load()) {
        {
            std::unique_lock<std::mutex> lk(reaperMtx_);
            reaperCv_.wait_for(lk, std::chrono::milliseconds(250), [this] { return stopping_.load(); });
        }
        if (stopping_.load()) break;
        for (auto &s : registry_.reapIdle(std::chrono::milliseconds(cfg_.sessionIdleMs))) {
            if (s.kind != ProxySubscriber::Kind::Control) continue;
            std::cout << "[proxy] Control session " << s.session << " idle, stopping it\n";
            translator_.closeSession(s.session);
        }
    }
}

void ProxyGateway::closeAll() {
    if (listenSocket_) {
        us_listen_socket_close(0, listenSocket_);
        listenSocket_ = nullptr;
    }
    auto streams = streams_;
    for (auto &kv : streams) {
        auto &sc = kv.second;
        if (!sc->aborted && !sc->finished) {
            sc->aborted = true;
            sc->res->close();
        }
        finishStream(sc);
    }
    auto sockets = sockets_;
    for (auto *ws : sockets) ws->close();
    for (auto &s : registry_.clear()) {
        if (s.kind == ProxySubscriber::Kind::Control && !s.persistent) translator_.closeSession(s.session);
    }
}

void ProxyGateway::stop() {
    if (stopping_.exchange(true)) return;
    reaperCv_.notify_all();
    defer([this]() { closeAll(); });
}

bool ProxyGateway::run() {
    auto app = uWS::App();
    {
        std::lock_guard<std::mutex> lk(loopMtx_);
        loop_ = uWS::Loop::get();
    }

    app.ws<SocketData>("/control/ws", {
        .maxPayloadLength = 16 * 1024,
        .idleTimeout = 60,
        .upgrade = [this](auto *res, auto *req, auto *context) {
            SocketData init;
            init.peer = std::string(res->getRemoteAddressAsText());
            init.session = std::string(req->getQuery("session"));
            if (init.session.empty()) init.session = "ws-" + std::to_string(++wsSeq_);
            res->template upgrade<SocketData>(
                std::move(init),
                req->getHeader("sec-websocket-key"),
                req->getHeader("sec-websocket-protocol"),
                req->getHeader("sec-websocket-extensions"),
                context
            );
        },
        .open = [this](auto *ws) {
            auto *ud = ws->getUserData();
            sockets_.insert(ws);
            ud->subscriberId = registry_.add(ProxySubscriber::Kind::Control, ud->peer, ud->session, true);
            std::cout << "[proxy] Control socket " << ud->session << " from " << ud->peer
                      << " opened. Sockets: " << sockets_.size() << "\n";
            json info = {
                {"type", "info"},
                {"session", ud->session},
                {"videoConnected", relay_.stats().upstreamConnected},
                {"controlConnected", controlHealthy_.load()}
            };
            ws->send(info.dump(), uWS::OpCode::TEXT);
        },
        .message = [this](auto *ws, std::string_view msg, uWS::OpCode opCode) {
            if (opCode == uWS::OpCode::BINARY) return;
            auto *ud = ws->getUserData();
            registry_.touch(ud->subscriberId);
            json obj;
            try {
                obj = json::parse(msg);
            } catch (const json::exception &) {
                ws->send(json({{"type", "info"}, {"error", "bad_json"}}).dump(), uWS::OpCode::TEXT);
                return;
            }
            if (obj.is_object() && obj.value("type", "") == "ping") {
                ws->send(json({{"type", "pong"}}).dump(), uWS::OpCode::TEXT);
                return;
            }
            postEvents(obj, ud->session);
        },
        .close = [this](auto *ws, int /*code*/, std::string_view /*msg*/) {
            auto *ud = ws->getUserData();
            sockets_.erase(ws);
            registry_.remove(ud->subscriberId);
            translator_.closeSession(ud->session);
            std::cout << "[proxy] Control socket " << ud->session << " closed. Sockets: " << sockets_.size() << "\n";
        }
    });

    app.any("/*", [this](auto *res, auto *req) { dispatch(res, req); });

    bool listening = false;
    app.listen(cfg_.bindHost, cfg_.port, [this, &listening](auto *token) {
        if (token) {
            listenSocket_ = token;
            listening = true;
            boundPort_.store(us_socket_local_port(0, (struct us_socket_t *)token));
            std::cout << "[proxy] HTTP server listening on http://" << cfg_.bindHost << ":" << boundPort_.load() << "/\n";
        } else {
            std::cerr << "[proxy] Failed to listen on " << cfg_.bindHost << ":" << cfg_.port << "\n";
        }
    });
    if (!listening) {
        std::lock_guard<std::mutex> lk(loopMtx_);
        loop_ = nullptr;
        return false;
    }

    relay_.setStateCallback([this](bool connected) { broadcastInfo(json{{"videoConnected", connected}}); });
    reaper_ = std::thread([this] { reaperLoop(); });
    if (stopping_.load()) closeAll();

    // Run app (blocks until listen socket and all connections are closed)
    app.run();

    relay_.setStateCallback(nullptr);
    {
        std::lock_guard<std::mutex> lk(loopMtx_);
        loop_ = nullptr;
    }
    boundPort_.store(0);
    stopping_.store(true);
    reaperCv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
    pool_.shutdown();
    return true;
}

} // namespace wifiproxy
