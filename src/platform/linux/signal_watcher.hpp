#pragma once

#include <atomic>
#include <signal.h>
#include <stop_token>
#include <thread>

// Turns SIGINT/SIGTERM into a stop request on the given stop_source.
// start() must run before any other thread is spawned so the blocked
// signal mask is inherited by all of them.
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source source);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start();

    // Signal number that triggered the stop, 0 if none arrived.
    int received_signal() const { return received_.load(std::memory_order_acquire); }

private:
    void watch(std::stop_token st);

    std::stop_source source_;
    int signal_fd_ = -1;
    sigset_t old_mask_{};
    bool mask_changed_ = false;
    std::atomic<int> received_{0};
    std::jthread thread_;
};
