#include "platform/linux/signal_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/signalfd.h>
#include <unistd.h>

SignalWatcher::SignalWatcher(std::stop_source source)
    : source_(std::move(source)) {}

SignalWatcher::~SignalWatcher() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (mask_changed_) ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

bool SignalWatcher::start() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, &old_mask_) != 0) {
        std::println(stderr, "signals: pthread_sigmask failed");
        return false;
    }
    mask_changed_ = true;

    signal_fd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signals: signalfd failed: {}", std::strerror(errno));
        return false;
    }

    thread_ = std::jthread([this](std::stop_token st) { watch(st); });
    return true;
}

void SignalWatcher::watch(std::stop_token st) {
    while (!st.stop_requested()) {
        pollfd pfd{.fd = signal_fd_, .events = POLLIN, .revents = 0};
        int n = ::poll(&pfd, 1, 200);
        if (n <= 0) continue;

        signalfd_siginfo info;
        if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) continue;

        received_.store(static_cast<int>(info.ssi_signo), std::memory_order_release);
        source_.request_stop();
    }
}
