#include "minitest.h"

#include <csignal>

int main() {
    // Loopback servers in the tests close sockets under the client
    std::signal(SIGPIPE, SIG_IGN);
    return mini::run_all();
}
