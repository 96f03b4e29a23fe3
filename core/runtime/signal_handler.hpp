#pragma once

#include <atomic>

namespace kasa {
namespace runtime {

/**
 * @brief SIGINT / SIGTERM bookkeeping for the polling loop
 *
 * The handler only stores the signal number; the loop notices it at its next
 * wait_for() slice. A second signal while shutdown is pending exits at once,
 * for the case where a device or discovery call is stuck in a socket wait.
 */
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested() { return last_signal_.load() != 0; }

    // Signal that requested shutdown, 0 if none
    static int last_signal() { return last_signal_.load(); }

    // Sleeps up to timeout_ms in short slices; returns false if shutdown was requested
    static bool wait_for(int timeout_ms);

    // Marks shutdown without a signal (tests, embedding)
    static void request_shutdown(int signal_number);
    static void reset();

private:
    static void handle_signal(int signal_number);
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace kasa
