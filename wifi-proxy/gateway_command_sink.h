#pragma once
#include "control_translator.h"
#include "gateway_client.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace wifiproxy {

// Delivers commands to the device's control endpoint. Keeps only the newest
// undelivered command per session; a single worker does the blocking POSTs.
class GatewayCommandSink : public CommandSink {
public:
    GatewayCommandSink(GatewayClient &client, std::string controlPath);
    ~GatewayCommandSink() override;

    void start();
    // Delivers what is still pending, then joins the worker
    void stop();

    void forward(const std::string &session, const ControlCommand &cmd) override;

    // Called on delivery health transitions (worker thread)
    void setHealthCallback(std::function<void(bool ok, const std::string &detail)> cb);

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }

    // {"type":"xy","x":-255..255,"y":-255..255} | {"type":"stop"} | {"type":"action","action":"stand"}
    static nlohmann::json toDeviceJson(const ControlCommand &cmd);

private:
    void workerLoop();
    void deliver(const ControlCommand &cmd);

    GatewayClient &client_;
    std::string controlPath_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::map<std::string, ControlCommand> latest_;
    std::deque<std::string> order_;
    bool running_ = false;
    std::function<void(bool, const std::string&)> healthCb_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    bool healthy_ = true;   // worker thread only
    std::thread worker_;
};

} // namespace wifiproxy
