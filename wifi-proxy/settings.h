#pragma once
#include <cstddef>
#include <string>

namespace wifiproxy {

// Runtime tunables. Defaults match a stock ESP32 camera/robot firmware:
// HTTP API on :80, MJPEG on :81/stream, JSON control on POST /control.
struct Settings {
    int gatewayHttpPort = 80;
    int streamPort = 81;
    std::string streamPath = "/stream";
    std::string controlPath = "/control";

    int connectTimeoutMs = 3000;
    int readTimeoutMs = 5000;

    size_t relayBufferFrames = 3;
    int relayMaxReconnects = 5;

    int heartbeatMs = 250;
    int minIntervalMs = 50;
    int sessionIdleMs = 3000;

    std::string webRoot;
    std::string bindHost = "0.0.0.0";

    // Throws ConfigError on unparsable or out-of-range values
    static Settings fromEnv();
};

} // namespace wifiproxy
