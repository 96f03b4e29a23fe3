#include "signal_handler.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

namespace kasa {
namespace runtime {

namespace {
constexpr int kWaitSliceMs = 50;
constexpr int kForcedExitCode = 130;
}  // namespace

std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool SignalHandler::wait_for(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!is_shutdown_requested()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                               std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return true;
        }
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(kWaitSliceMs)));
    }
    return false;
}

void SignalHandler::request_shutdown(int signal_number) { last_signal_.store(signal_number); }

void SignalHandler::reset() { last_signal_.store(0); }

void SignalHandler::handle_signal(int signal_number) {
    // Only lock-free atomics and _exit are async-signal-safe here
    if (last_signal_.exchange(signal_number) != 0) {
        _exit(kForcedExitCode);
    }
}

}  // namespace runtime
}  // namespace kasa
