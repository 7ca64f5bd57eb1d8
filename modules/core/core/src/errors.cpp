#include "errors.h"

namespace ferry {

const char* category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Connection:    return "connection";
        case ErrorCategory::Protocol:      return "protocol";
        case ErrorCategory::IO:            return "io";
        case ErrorCategory::Integrity:     return "integrity";
        case ErrorCategory::PathSafety:    return "path_safety";
        case ErrorCategory::Cancellation:  return "cancellation";
    }
    return "unknown";
}

void throw_for_status(int status, const std::string& body) {
    std::string detail = body.size() > 256 ? body.substr(0, 256) : body;
    if (status == 403) {
        throw PathSafetyError(detail);
    }
    throw ProtocolError(status, "server returned " + std::to_string(status) +
                                    (detail.empty() ? "" : ": " + detail));
}

} // namespace ferry
