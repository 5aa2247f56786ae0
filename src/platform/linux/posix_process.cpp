#include "platform/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace platform {

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    // Built before fork(): the child may only call async-signal-safe functions.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (opts.capture_stdout && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        if (pipefd[0] >= 0) { ::close(pipefd[0]); ::close(pipefd[1]); }
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Own process group: the terminal's Ctrl-C must reach only us.
        ::setpgid(0, 0);

        // The parent blocks SIGINT/SIGTERM for its signalfd; undo that.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (!opts.capture_stdout) ::dup2(devnull, STDOUT_FILENO);
        }
        if (opts.capture_stdout) {
            ::dup2(pipefd[1], STDOUT_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int out_fd = -1;
    if (opts.capture_stdout) {
        ::close(pipefd[1]);
        out_fd = pipefd[0];
    }

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + opts.timeout;
    bool killed = false;
    int status = 0;
    char buf[64 * 1024];

    while (true) {
        if (!killed) {
            if (opts.stop.stop_requested()) {
                result.cancelled = true;
                ::kill(-pid, SIGKILL);
                killed = true;
            } else if (opts.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                ::kill(-pid, SIGKILL);
                killed = true;
            }
        }

        // Drain stdout until EOF before reaping the child.
        if (out_fd >= 0) {
            pollfd pfd{.fd = out_fd, .events = POLLIN, .revents = 0};
            int n = ::poll(&pfd, 1, 50);
            if (n > 0) {
                ssize_t r = ::read(out_fd, buf, sizeof(buf));
                if (r > 0) {
                    result.output.append(buf, static_cast<size_t>(r));
                } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                    ::close(out_fd);
                    out_fd = -1;
                }
            }
            continue;
        }

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

} // namespace platform
