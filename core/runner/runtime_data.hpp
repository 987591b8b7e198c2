#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "process/child_process.hpp"

namespace daemon_runner {
namespace runner {

// RuntimeData is the record shared (via std::shared_ptr) between a
// DaemonRunner and its two reader threads for one supervision session
// (start() through stop/exit, reused across restart()).
//
// Every field is guarded by `mutex`; start-up replaces the process handle and
// both thread handles as one unit under it.
template <typename State>
struct RuntimeData {
    explicit RuntimeData(State initial_state) : state(std::move(initial_state)) {}

    // The last holder is usually a reader thread leaving its loop; it cannot
    // join itself, so its own handle is detached and the other one joined
    // (that thread has already released the record, so the join is short).
    ~RuntimeData() {
        retire(stdout_thread);
        retire(stderr_thread);
    }

    RuntimeData(const RuntimeData &) = delete;
    RuntimeData &operator=(const RuntimeData &) = delete;

    std::mutex mutex;

    State state;

    // Null only before the first successful spawn
    std::unique_ptr<process::ChildProcess> process;

    std::thread stdout_thread;
    std::thread stderr_thread;

private:
    static void retire(std::thread &thread) {
        if (!thread.joinable()) {
            return;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
};

}  // namespace runner
}  // namespace daemon_runner
