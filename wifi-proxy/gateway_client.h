#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace httplib { class Client; }

namespace wifiproxy {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int status = 0;
    std::string reason;
    HeaderList headers;
    std::string body;

    // Case-insensitive; "" when absent
    std::string header(const std::string &name) const;
};

// Where the device lives and which local address/device every socket must originate from
struct GatewayEndpoint {
    std::string host;
    int httpPort = 80;
    std::string bindAddress;    // secondary interface's IPv4 address
    std::string bindDevice;     // secondary interface name; resolved to its address when bindAddress is empty
};

struct GatewayOptions {
    int connectTimeoutMs = 3000;
    int readTimeoutMs = 5000;
    int commandTimeoutMs = 1000;
    int maxAttempts = 3;        // idempotent requests only
    int retryBaseMs = 200;
    int retryMaxMs = 1000;
};

// Long-lived response body (e.g. the MJPEG stream), received on its own thread
class GatewayStream {
public:
    ~GatewayStream();
    GatewayStream(const GatewayStream&) = delete;
    GatewayStream &operator=(const GatewayStream&) = delete;

    // Status and headers; the body arrives through read()
    const HttpResponse &head() const { return head_; }
    // Appends the next body bytes to out. Returns false on a clean end of stream.
    // Throws ProxyError on socket error, read timeout or interrupt().
    bool read(std::string &out);
    // Thread-safe; wakes a blocked read()
    void interrupt();

private:
    friend class GatewayClient;
    GatewayStream(std::unique_ptr<httplib::Client> cli, std::string target);
    // Starts the receiver and waits for the response head. Throws GatewayUnreachable.
    void start();
    void receive();

    std::unique_ptr<httplib::Client> cli_;
    std::string target_;
    std::mutex mtx_;
    std::condition_variable cv_;
    HttpResponse head_;
    bool headDone_ = false;
    bool ended_ = false;
    std::string error_;
    std::string pending_;
    std::atomic<bool> interrupted_{false};
    std::thread worker_;
};

class GatewayClient {
public:
    // Throws ConfigError when ep names neither a local address nor a device;
    // gateway traffic never leaves through the default route.
    explicit GatewayClient(GatewayEndpoint ep, GatewayOptions opts = {});

    // GET and HEAD are retried with backoff; other methods are sent once.
    // Throws GatewayUnreachable when no response could be obtained, including
    // when the socket could not be bound to the secondary interface.
    HttpResponse request(const std::string &method, const std::string &target,
                         const std::string &body = "", const HeaderList &headers = {});

    // POST a JSON control command. At most one retry, short timeout.
    // Returns false when the device did not acknowledge with 2xx.
    bool sendCommand(const std::string &path, const std::string &jsonBody);

    // GET target on port (0 = HTTP port) and return once the response head is in
    std::unique_ptr<GatewayStream> openStream(const std::string &target, int port = 0);

    const GatewayEndpoint &endpoint() const { return ep_; }
    const GatewayOptions &options() const { return opts_; }

private:
    std::unique_ptr<httplib::Client> makeClient(int port, int connectTimeoutMs, int readTimeoutMs) const;
    HttpResponse exchange(const std::string &method, const std::string &target,
                          const std::string &body, const HeaderList &headers, int timeoutMs);
    std::string via() const;

    GatewayEndpoint ep_;
    GatewayOptions opts_;
};

} // namespace wifiproxy
