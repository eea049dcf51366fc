#pragma once
#include "gateway_client.h"
#include "stream_relay.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace wifiproxy {

// Cuts JPEG images out of the device's multipart MJPEG response body
class MjpegFrameSource : public FrameSource {
public:
    MjpegFrameSource(GatewayClient &client, std::string path, int port);

    void open() override;
    bool readFrame(std::string &payload) override;
    void interrupt() override;
    void close() override;

    // Moves the first complete 0xFFD8..0xFFD9 image out of acc into frame.
    // Bytes before it are discarded; a partial image stays in acc.
    static bool extractJpeg(std::string &acc, std::string &frame);

private:
    GatewayClient &client_;
    std::string path_;
    int port_;

    std::mutex mtx_;
    std::unique_ptr<GatewayStream> stream_;
    std::atomic<bool> interrupted_{false};
    std::string acc_;
};

} // namespace wifiproxy
