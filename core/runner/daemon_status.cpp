#include "daemon_status.hpp"

namespace daemon_runner {
namespace runner {

std::string DaemonStatus::to_string() const {
    switch (state) {
        case State::INIT:
            return "Init";
        case State::RUNNING:
            return "Running";
        case State::STOPPED:
            return "Stopped(" + (exit ? exit->to_string() : std::string("unknown")) + ")";
        default:
            return "Unknown";
    }
}

}  // namespace runner
}  // namespace daemon_runner
