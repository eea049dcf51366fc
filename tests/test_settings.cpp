#include "minitest.h"
#include "test_support.h"
#include "errors.h"
#include "settings.h"

using namespace wifiproxy;
using testutil::ScopedEnv;

TEST(settings_defaults) {
    ScopedEnv a("STREAM_PORT", nullptr), b("CONTROL_HEARTBEAT_MS", nullptr), c("CONTROL_MIN_INTERVAL_MS", nullptr);
    ScopedEnv d("WEB_ROOT", nullptr);
    Settings s = Settings::fromEnv();
    ASSERT_EQ(s.gatewayHttpPort, 80);
    ASSERT_EQ(s.streamPort, 81);
    ASSERT_EQ(s.streamPath, "/stream");
    ASSERT_EQ(s.controlPath, "/control");
    ASSERT_EQ(s.heartbeatMs, 250);
    ASSERT_EQ(s.minIntervalMs, 50);
    ASSERT_TRUE(s.webRoot.size() > 4);
    ASSERT_EQ(s.webRoot.substr(s.webRoot.size() - 4), "/web");
}

TEST(settings_read_from_environment) {
    ScopedEnv a("STREAM_PORT", "8081"), b("STREAM_PATH", "/mjpeg/1"), c("WEB_ROOT", "/srv/ui");
    ScopedEnv d("RELAY_BUFFER_FRAMES", "8");
    Settings s = Settings::fromEnv();
    ASSERT_EQ(s.streamPort, 8081);
    ASSERT_EQ(s.streamPath, "/mjpeg/1");
    ASSERT_EQ(s.webRoot, "/srv/ui");
    ASSERT_EQ(s.relayBufferFrames, 8u);
}

TEST(settings_reject_bad_values) {
    {
        ScopedEnv a("STREAM_PORT", "eighty");
        ASSERT_THROWS(Settings::fromEnv(), ConfigError);
    }
    {
        ScopedEnv a("GATEWAY_HTTP_PORT", "70000");
        ASSERT_THROWS(Settings::fromEnv(), ConfigError);
    }
    {
        ScopedEnv a("CONTROL_PATH", "control");
        ASSERT_THROWS(Settings::fromEnv(), ConfigError);
    }
    {
        ScopedEnv a("CONTROL_HEARTBEAT_MS", "100"), b("CONTROL_MIN_INTERVAL_MS", "200");
        ASSERT_THROWS(Settings::fromEnv(), ConfigError);
    }
    {
        ScopedEnv a("RELAY_MAX_RECONNECTS", "0");
        ASSERT_THROWS(Settings::fromEnv(), ConfigError);
    }
}
