#include "settings.h"
#include "errors.h"
#include "net_util.h"

namespace wifiproxy {

static int positive(const char *name, int v) {
    if (v <= 0) throw ConfigError(std::string(name) + " must be > 0");
    return v;
}

static int portNumber(const char *name, int v) {
    if (v <= 0 || v > 65535) throw ConfigError(std::string(name) + " must be in 1..65535");
    return v;
}

static std::string absPath(const char *name, std::string v) {
    if (v.empty() || v[0] != '/') throw ConfigError(std::string(name) + " must start with '/'");
    return v;
}

Settings Settings::fromEnv() {
    Settings s;
    s.gatewayHttpPort = portNumber("GATEWAY_HTTP_PORT", envInt("GATEWAY_HTTP_PORT", s.gatewayHttpPort));
    s.streamPort = portNumber("STREAM_PORT", envInt("STREAM_PORT", s.streamPort));
    s.streamPath = absPath("STREAM_PATH", envStr("STREAM_PATH", s.streamPath.c_str()));
    s.controlPath = absPath("CONTROL_PATH", envStr("CONTROL_PATH", s.controlPath.c_str()));

    s.connectTimeoutMs = positive("GATEWAY_CONNECT_TIMEOUT_MS", envInt("GATEWAY_CONNECT_TIMEOUT_MS", s.connectTimeoutMs));
    s.readTimeoutMs = positive("GATEWAY_READ_TIMEOUT_MS", envInt("GATEWAY_READ_TIMEOUT_MS", s.readTimeoutMs));

    s.relayBufferFrames = (size_t)positive("RELAY_BUFFER_FRAMES", envInt("RELAY_BUFFER_FRAMES", (int)s.relayBufferFrames));
    s.relayMaxReconnects = positive("RELAY_MAX_RECONNECTS", envInt("RELAY_MAX_RECONNECTS", s.relayMaxReconnects));

    s.heartbeatMs = positive("CONTROL_HEARTBEAT_MS", envInt("CONTROL_HEARTBEAT_MS", s.heartbeatMs));
    s.minIntervalMs = positive("CONTROL_MIN_INTERVAL_MS", envInt("CONTROL_MIN_INTERVAL_MS", s.minIntervalMs));
    s.sessionIdleMs = positive("CONTROL_SESSION_IDLE_MS", envInt("CONTROL_SESSION_IDLE_MS", s.sessionIdleMs));
    if (s.minIntervalMs > s.heartbeatMs) {
        throw ConfigError("CONTROL_MIN_INTERVAL_MS must not exceed CONTROL_HEARTBEAT_MS");
    }

    // Prefer the directory where the binary resides
    s.webRoot = envStr("WEB_ROOT", (getExecutableDir() + "/web").c_str());
    s.bindHost = envStr("BIND_HOST", s.bindHost.c_str());
    return s;
}

} // namespace wifiproxy
