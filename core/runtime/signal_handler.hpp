#pragma once

#include <atomic>

namespace daemon_runner {
namespace runtime {

// SIGINT/SIGTERM request a shutdown: the runtime loop polls the flag and then
// forwards the stop to the supervised daemon.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Number of the signal that requested shutdown, 0 if none
    static int last_signal();

    // Clear the request (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace daemon_runner
