#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace wifiproxy {

enum class RouteKind { Static, Stream, Control, ControlSocket, Status, PassThrough };
const char *toString(RouteKind k);

// Longest-prefix routing on path segments. Unmatched paths fall back to PassThrough.
class RouteTable {
public:
    // exact: only the path itself matches, not its children
    void add(std::string prefix, RouteKind kind, bool exact = false);
    // path may carry a query string
    RouteKind match(std::string_view path) const;

    static RouteTable defaults();

private:
    struct Route {
        std::string prefix;
        RouteKind kind;
        bool exact;
    };
    std::vector<Route> routes_;
};

} // namespace wifiproxy
