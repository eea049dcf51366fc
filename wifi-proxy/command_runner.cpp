#include "command_runner.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wifiproxy {

namespace {

struct Pipe {
    int rd = -1;
    int wr = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        rd = fds[0];
        wr = fds[1];
        return true;
    }
    void closeRead() { if (rd >= 0) { ::close(rd); rd = -1; } }
    void closeWrite() { if (wr >= 0) { ::close(wr); wr = -1; } }
    ~Pipe() { closeRead(); closeWrite(); }
};

// Appends what is readable; returns false once the writer side is gone
bool readSome(int fd, std::string &into) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        into.append(buf, (size_t)n);
        return true;
    }
    return n < 0 && (errno == EINTR || errno == EAGAIN);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // namespace

CmdResult runCommandWithTimeout(const std::vector<std::string> &argv, int timeoutMs) {
    CmdResult r;
    if (argv.empty()) {
        r.code = 127;
        r.err = "empty command";
        return r;
    }

    Pipe out, err;
    if (!out.open() || !err.open()) {
        r.code = 1;
        r.err = "pipe failed";
        return r;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto &a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        r.code = 1;
        r.err = "fork failed";
        return r;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out.wr, STDOUT_FILENO);
        ::dup2(err.wr, STDERR_FILENO);
        // nmcli output is parsed; keep it untranslated
        ::setenv("LC_ALL", "C", 1);
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }
    out.closeWrite();
    err.closeWrite();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    bool outOpen = true, errOpen = true, timedOut = false;
    while (outOpen || errOpen) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfds[2];
        nfds_t n = 0;
        if (outOpen) pfds[n++] = pollfd{out.rd, POLLIN, 0};
        if (errOpen) pfds[n++] = pollfd{err.rd, POLLIN, 0};
        int rc = ::poll(pfds, n, (int)left);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (pfds[i].fd == out.rd) outOpen = readSome(out.rd, r.out);
            else errOpen = readSome(err.rd, r.err);
        }
    }

    int status = 0;
    if (timedOut) {
        ::kill(-pid, SIGTERM);
        ::usleep(200 * 1000);
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        r.code = 124;
        return r;
    }
    // Both pipes closed; the child is exiting
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    r.code = decodeStatus(status);
    return r;
}

} // namespace wifiproxy
