#include "route_table.h"

namespace wifiproxy {

const char *toString(RouteKind k) {
    switch (k) {
        case RouteKind::Static: return "static";
        case RouteKind::Stream: return "stream";
        case RouteKind::Control: return "control";
        case RouteKind::ControlSocket: return "control-ws";
        case RouteKind::Status: return "status";
        case RouteKind::PassThrough: return "pass-through";
    }
    return "unknown";
}

void RouteTable::add(std::string prefix, RouteKind kind, bool exact) {
    if (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
    routes_.push_back(Route{std::move(prefix), kind, exact});
}

RouteKind RouteTable::match(std::string_view path) const {
    size_t q = path.find('?');
    if (q != std::string_view::npos) path = path.substr(0, q);
    if (path.empty()) path = "/";

    const Route *best = nullptr;
    for (auto &r : routes_) {
        std::string_view p(r.prefix);
        bool hit;
        if (r.exact) {
            hit = (path == p);
        } else if (p == "/") {
            hit = true;
        } else {
            // "/stream" matches "/stream" and "/stream/x", not "/streams"
            hit = path.size() >= p.size() && path.compare(0, p.size(), p) == 0 &&
                  (path.size() == p.size() || path[p.size()] == '/');
        }
        if (hit && (!best || p.size() > best->prefix.size())) best = &r;
    }
    return best ? best->kind : RouteKind::PassThrough;
}

RouteTable RouteTable::defaults() {
    RouteTable t;
    t.add("/", RouteKind::Static, true);
    t.add("/index.html", RouteKind::Static, true);
    t.add("/favicon.ico", RouteKind::Static, true);
    t.add("/assets", RouteKind::Static);
    t.add("/stream", RouteKind::Stream);
    t.add("/control", RouteKind::Control);
    t.add("/control/ws", RouteKind::ControlSocket);
    t.add("/api/status", RouteKind::Status, true);
    return t;
}

} // namespace wifiproxy
