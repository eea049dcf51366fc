#include "gateway_client.h"
#include "errors.h"
#include "net_util.h"

#include <httplib.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

#include <sys/socket.h>

namespace wifiproxy {

// Receiver waits for the reader beyond this
static const size_t kMaxStreamBuffered = 8u << 20;

std::string HttpResponse::header(const std::string &name) const {
    const std::string want = toLower(name);
    for (auto &h : headers) {
        if (toLower(h.first) == want) return h.second;
    }
    return "";
}

static HttpResponse fromHttplib(const httplib::Response &r, bool withBody) {
    HttpResponse out;
    out.status = r.status;
    out.reason = r.reason;
    for (auto &h : r.headers) out.headers.emplace_back(h.first, h.second);
    if (withBody) out.body = r.body;
    return out;
}

// The address bind is what pins a socket; the device bind needs CAP_NET_RAW and is best effort
static void bindToDevice(httplib::socket_t sock, const std::string &dev) {
    if (dev.empty()) return;
    if (::setsockopt(sock, SOL_SOCKET, SO_BINDTODEVICE, dev.c_str(), (socklen_t)dev.size()) != 0) {
        static std::atomic<bool> warned{false};
        if (!warned.exchange(true)) {
            std::cerr << "[gateway] SO_BINDTODEVICE(" << dev << ") failed: " << strerror(errno)
                      << "; relying on the source address bind\n";
        }
    }
}

// --------------- GatewayStream ---------------
GatewayStream::GatewayStream(std::unique_ptr<httplib::Client> cli, std::string target)
    : cli_(std::move(cli)), target_(std::move(target)) {}

GatewayStream::~GatewayStream() {
    interrupt();
    if (worker_.joinable()) worker_.join();
}

void GatewayStream::start() {
    worker_ = std::thread([this] { receive(); });
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return headDone_ || ended_; });
    if (!headDone_) {
        throw GatewayUnreachable("GET " + target_ + ": " + (error_.empty() ? std::string("no response") : error_));
    }
}

void GatewayStream::receive() {
    const httplib::Headers headers = { {"Accept", "multipart/x-mixed-replace, */*"} };
    httplib::Result res = cli_->Get(target_, headers,
        [this](const httplib::Response &r) {
            std::lock_guard<std::mutex> lk(mtx_);
            head_ = fromHttplib(r, false);
            headDone_ = true;
            cv_.notify_all();
            return !interrupted_.load();
        },
        [this](const char *data, size_t n) {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return pending_.size() < kMaxStreamBuffered || interrupted_.load(); });
            if (interrupted_.load()) return false;
            pending_.append(data, n);
            cv_.notify_all();
            return true;
        });

    std::lock_guard<std::mutex> lk(mtx_);
    ended_ = true;
    if (!res && !interrupted_.load()) error_ = httplib::to_string(res.error());
    cv_.notify_all();
}

bool GatewayStream::read(std::string &out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !pending_.empty() || ended_ || interrupted_.load(); });
    if (interrupted_.load()) throw ProxyError("stream interrupted");
    if (!pending_.empty()) {
        out += pending_;
        pending_.clear();
        cv_.notify_all();
        return true;
    }
    if (!error_.empty()) throw ProxyError("stream read: " + error_);
    return false;
}

void GatewayStream::interrupt() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        interrupted_.store(true);
    }
    cv_.notify_all();
    cli_->stop();
}

// --------------- GatewayClient ---------------
GatewayClient::GatewayClient(GatewayEndpoint ep, GatewayOptions opts)
    : ep_(std::move(ep)), opts_(opts) {
    if (ep_.bindAddress.empty() && ep_.bindDevice.empty()) {
        throw ConfigError("gateway " + ep_.host + " has no local address or device to send from");
    }
}

std::string GatewayClient::via() const {
    return " via " + (ep_.bindAddress.empty() ? ep_.bindDevice : ep_.bindAddress);
}

std::unique_ptr<httplib::Client> GatewayClient::makeClient(int port, int connectTimeoutMs, int readTimeoutMs) const {
    auto cli = std::make_unique<httplib::Client>(ep_.host, port);
    cli->set_connection_timeout(std::chrono::milliseconds(connectTimeoutMs));
    cli->set_read_timeout(std::chrono::milliseconds(readTimeoutMs));
    cli->set_write_timeout(std::chrono::milliseconds(readTimeoutMs));
    cli->set_keep_alive(false);
    // A device name is resolved to the device's own address; the request fails if it has none
    cli->set_interface(ep_.bindAddress.empty() ? ep_.bindDevice : ep_.bindAddress);
    const std::string dev = ep_.bindDevice;
    cli->set_socket_options([dev](httplib::socket_t sock) { bindToDevice(sock, dev); });
    return cli;
}

HttpResponse GatewayClient::exchange(const std::string &method, const std::string &target,
                                     const std::string &body, const HeaderList &headers, int timeoutMs) {
    auto cli = makeClient(ep_.httpPort, std::min(timeoutMs, opts_.connectTimeoutMs), timeoutMs);

    httplib::Request req;
    req.method = method;
    req.path = target;
    for (auto &h : headers) req.headers.emplace(h.first, h.second);
    req.body = body;

    httplib::Result res = cli->send(req);
    if (!res) {
        throw GatewayUnreachable(method + " " + target + via() + ": " + httplib::to_string(res.error()));
    }
    return fromHttplib(*res, method != "HEAD");
}

HttpResponse GatewayClient::request(const std::string &method, const std::string &target,
                                    const std::string &body, const HeaderList &headers) {
    const bool idempotent = (method == "GET" || method == "HEAD");
    const int attempts = idempotent ? std::max(1, opts_.maxAttempts) : 1;
    for (int attempt = 0;; ++attempt) {
        try {
            return exchange(method, target, body, headers, opts_.readTimeoutMs);
        } catch (const GatewayUnreachable &e) {
            if (attempt + 1 >= attempts) throw;
            int delay = computeBackoffMs(opts_.retryBaseMs, opts_.retryMaxMs, attempt);
            std::cout << "[gateway] " << e.what() << ". Retry in ~" << delay << "ms (attempt "
                      << (attempt + 1) << ")\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
}

bool GatewayClient::sendCommand(const std::string &path, const std::string &jsonBody) {
    const HeaderList headers = { {"Content-Type", "application/json"} };
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            HttpResponse r = exchange("POST", path, jsonBody, headers, opts_.commandTimeoutMs);
            return r.status >= 200 && r.status < 300;
        } catch (const GatewayUnreachable &e) {
            if (attempt == 1) {
                std::cerr << "[gateway] command not delivered: " << e.what() << "\n";
            }
        }
    }
    return false;
}

std::unique_ptr<GatewayStream> GatewayClient::openStream(const std::string &target, int port) {
    if (port <= 0) port = ep_.httpPort;
    std::unique_ptr<GatewayStream> s(
        new GatewayStream(makeClient(port, opts_.connectTimeoutMs, opts_.readTimeoutMs), target));
    s->start();
    return s;
}

} // namespace wifiproxy
