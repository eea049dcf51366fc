#include "gateway_command_sink.h"

#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace wifiproxy {

GatewayCommandSink::GatewayCommandSink(GatewayClient &client, std::string controlPath)
    : client_(client), controlPath_(std::move(controlPath)) {}

GatewayCommandSink::~GatewayCommandSink() {
    stop();
}

json GatewayCommandSink::toDeviceJson(const ControlCommand &cmd) {
    if (cmd.kind == ControlCommand::Kind::Move) {
        return json{ {"type", "xy"},
                     {"x", (int)std::lround(cmd.dx * 255.0)},
                     {"y", (int)std::lround(cmd.dy * 255.0)} };
    }
    if (cmd.action == Action::Stop) return json{ {"type", "stop"} };
    return json{ {"type", "action"}, {"action", toString(cmd.action)} };
}

void GatewayCommandSink::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_ || worker_.joinable()) return;
    running_ = true;
    worker_ = std::thread([this] { workerLoop(); });
}

void GatewayCommandSink::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void GatewayCommandSink::setHealthCallback(std::function<void(bool, const std::string&)> cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    healthCb_ = std::move(cb);
}

void GatewayCommandSink::forward(const std::string &session, const ControlCommand &cmd) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = latest_.find(session);
        if (it == latest_.end()) {
            latest_.emplace(session, cmd);
            order_.push_back(session);
        } else {
            it->second = cmd;   // superseded before delivery
        }
    }
    cv_.notify_one();
}

void GatewayCommandSink::deliver(const ControlCommand &cmd) {
    const bool ok = client_.sendCommand(controlPath_, toDeviceJson(cmd).dump());
    if (ok) delivered_.fetch_add(1);
    else failed_.fetch_add(1);

    if (ok != healthy_) {
        healthy_ = ok;
        std::function<void(bool, const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cb = healthCb_;
        }
        if (ok) std::cout << "[control] Gateway accepting commands again\n";
        else std::cerr << "[control] Gateway not accepting commands\n";
        if (cb) cb(ok, ok ? "" : "gateway_unreachable");
    }
}

void GatewayCommandSink::workerLoop() {
    for (;;) {
        std::string session;
        ControlCommand cmd;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return !order_.empty() || !running_; });
            if (order_.empty()) return;     // stopped and drained
            session = std::move(order_.front());
            order_.pop_front();
            auto it = latest_.find(session);
            if (it == latest_.end()) continue;
            cmd = it->second;
            latest_.erase(it);
        }
        deliver(cmd);
    }
}

} // namespace wifiproxy
