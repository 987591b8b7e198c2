#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

#include "daemon_status.hpp"
#include "result.hpp"

namespace daemon_runner {
namespace runner {

// State-type independent lifecycle surface of DaemonRunner, for callers that
// only drive the lifecycle (CLI runtime) and for mocking.
class IDaemonRunner {
public:
    virtual ~IDaemonRunner() = default;

    // Lifecycle
    virtual Result start() = 0;
    virtual Result restart() = 0;
    virtual Result stop() = 0;

    // Status
    virtual Result status(DaemonStatus &out) = 0;
    virtual std::optional<pid_t> pid() const = 0;
    virtual std::string display_name() const = 0;
};

}  // namespace runner
}  // namespace daemon_runner
