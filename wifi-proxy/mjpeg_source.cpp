#include "mjpeg_source.h"
#include "errors.h"

namespace wifiproxy {

static const size_t kMaxAccumulated = 4u << 20;

MjpegFrameSource::MjpegFrameSource(GatewayClient &client, std::string path, int port)
    : client_(client), path_(std::move(path)), port_(port) {}

void MjpegFrameSource::open() {
    if (interrupted_.load()) throw GatewayUnreachable("stream open interrupted");
    auto s = client_.openStream(path_, port_);
    int status = s->head().status;
    if (status != 200) {
        throw GatewayUnreachable("GET " + path_ + " returned HTTP " + std::to_string(status));
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (interrupted_.load()) throw GatewayUnreachable("stream open interrupted");
    stream_ = std::move(s);
    acc_.clear();
}

bool MjpegFrameSource::extractJpeg(std::string &acc, std::string &frame) {
    // parse JPEG frames by 0xFF 0xD8 ... 0xFF 0xD9
    static const std::string soi("\xFF\xD8", 2);
    static const std::string eoi("\xFF\xD9", 2);
    size_t start = acc.find(soi);
    if (start == std::string::npos) {
        // keep a possible half marker
        if (acc.size() > 1) acc.erase(0, acc.size() - 1);
        return false;
    }
    size_t end = acc.find(eoi, start + 2);
    if (end == std::string::npos) {
        if (start > 0) acc.erase(0, start);
        return false;
    }
    frame.assign(acc, start, end + 2 - start);
    acc.erase(0, end + 2);
    return true;
}

bool MjpegFrameSource::readFrame(std::string &payload) {
    GatewayStream *s;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        s = stream_.get();
    }
    if (!s) throw ProxyError("stream not open");

    for (;;) {
        if (extractJpeg(acc_, payload)) return true;
        if (acc_.size() > kMaxAccumulated) throw ProxyError("no JPEG end marker within 4 MiB");
        if (!s->read(acc_)) return false;
    }
}

void MjpegFrameSource::interrupt() {
    interrupted_.store(true);
    std::lock_guard<std::mutex> lk(mtx_);
    if (stream_) stream_->interrupt();
}

void MjpegFrameSource::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    stream_.reset();
    acc_.clear();
}

} // namespace wifiproxy
