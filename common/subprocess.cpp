// ============================================================
// subprocess.cpp -- fork/exec runner with captured output
// ============================================================

#include "subprocess.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

static constexpr int KILL_GRACE_MS = 5000;
static constexpr int POLL_INTERVAL_MS = 200;

static void append_capped(std::string& out, const char* data, size_t len) {
    out.append(data, len);
    if (out.size() > MAX_CAPTURED_OUTPUT) {
        out.erase(0, out.size() - MAX_CAPTURED_OUTPUT);
    }
}

Result run(const std::vector<std::string>& argv, const CancelToken* cancel) {
    if (argv.empty()) throw std::runtime_error("subprocess::run: empty argv");

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe failed: " + platform::errno_str(errno));
    }

    LOG_DEBUG("exec: " + utils::join(argv, " "));

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error("fork failed: " + platform::errno_str(err));
    }

    if (pid == 0) {
        // Child: stdout and stderr both go to the pipe
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, 0);
        dup2(fds[1], 1);
        dup2(fds[1], 2);
        execvp(cargv[0], cargv.data());
        // Only async-signal-safe calls from here: errno is written as digits
        char msg[64] = "exec failed: errno ";
        size_t len = strlen(msg);
        char digits[16];
        size_t nd = 0;
        for (int e = errno; nd == 0 || e > 0; e /= 10) digits[nd++] = (char)('0' + e % 10);
        while (nd > 0) msg[len++] = digits[--nd];
        msg[len++] = '\n';
        (void)!::write(2, msg, len);
        _exit(127);
    }

    ::close(fds[1]);

    Result res;
    bool term_sent = false;
    bool kill_sent = false;
    auto term_time = std::chrono::steady_clock::now();
    char buf[4096];

    for (;;) {
        if (cancel && cancel->cancelled() && !term_sent) {
            kill(pid, SIGTERM);
            term_sent = true;
            res.cancelled = true;
            term_time = std::chrono::steady_clock::now();
        }
        if (term_sent && !kill_sent &&
            std::chrono::steady_clock::now() - term_time >
                std::chrono::milliseconds(KILL_GRACE_MS)) {
            kill(pid, SIGKILL);
            kill_sent = true;
        }

        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            append_capped(res.output, buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break; // EOF or read error
    }
    ::close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid failed: " + platform::errno_str(errno));
        }
    }

    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }
    return res;
}

std::string describe(const Result& r) {
    if (r.cancelled) return "cancelled";
    if (r.signal != 0) return "killed by signal " + std::to_string(r.signal);
    return "exit code " + std::to_string(r.exit_code);
}

} // namespace subprocess
