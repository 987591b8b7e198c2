#pragma once

#include <string>

namespace daemon_runner {
namespace runner {

/**
 * @brief Failure kinds reported by the supervisor
 *
 * - INVALID_STATE: operation not allowed from the current lifecycle status
 * - SPAWN_FAILURE: the OS could not create the daemon process
 * - IO_FAILURE: pipe read, wait or signal-send failure
 * - ADAPTER_FAILURE: propagated verbatim from DaemonAdapter::prepare()
 * - DECODE_FAILURE: non UTF-8 data on a monitored stream (reader loops only)
 * - CONFIG: invalid daemon configuration
 */
enum class ErrorCode {
    OK,
    INVALID_STATE,
    SPAWN_FAILURE,
    IO_FAILURE,
    ADAPTER_FAILURE,
    DECODE_FAILURE,
    CONFIG
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::INVALID_STATE:
            return "INVALID_STATE";
        case ErrorCode::SPAWN_FAILURE:
            return "SPAWN_FAILURE";
        case ErrorCode::IO_FAILURE:
            return "IO_FAILURE";
        case ErrorCode::ADAPTER_FAILURE:
            return "ADAPTER_FAILURE";
        case ErrorCode::DECODE_FAILURE:
            return "DECODE_FAILURE";
        case ErrorCode::CONFIG:
            return "CONFIG";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Outcome of a supervisor operation: a code plus a human readable message
 */
struct Result {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }

    static Result success() { return Result{}; }
    static Result failure(ErrorCode code, const std::string &message) { return Result{code, message}; }

    // "INVALID_STATE: cannot start: daemon is Running"
    std::string to_string() const {
        if (ok()) {
            return "OK";
        }
        return error_code_to_string(code) + ": " + message;
    }
};

}  // namespace runner
}  // namespace daemon_runner
