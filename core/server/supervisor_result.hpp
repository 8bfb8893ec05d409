#pragma once

#include <string>

namespace indiweb {
namespace server {

enum class SupervisorErrorCode {
    OK,
    NOT_FOUND,            // Unknown driver label or profile
    INVALID_ARGUMENT,     // Descriptor cannot be encoded, empty profile
    ALREADY_RUNNING,      // start() while not STOPPED
    NOT_RUNNING,          // Driver operation while not RUNNING (or process died)
    CHANNEL_UNAVAILABLE,  // Control FIFO or client port unreachable
    START_FAILED          // Process or FIFO did not come up
};

// Outcome of a supervisor operation.
// Driver directives are fire-and-forget: success means "directive written",
// never "driver confirmed running".
struct SupervisorResult {
    bool success = true;
    SupervisorErrorCode code = SupervisorErrorCode::OK;
    std::string error_message;

    static SupervisorResult ok() { return SupervisorResult{}; }

    static SupervisorResult failure(SupervisorErrorCode code, const std::string &message) {
        SupervisorResult result;
        result.success = false;
        result.code = code;
        result.error_message = message;
        return result;
    }
};

}  // namespace server
}  // namespace indiweb
