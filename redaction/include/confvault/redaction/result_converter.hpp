#pragma once

#include "confvault/redaction/core.hpp"
#include <string>

namespace confvault {
namespace redaction {

// String forms of redaction outcomes, used for log context and metric labels

class ResultConverter {
public:
    // Contract: "sanitized" | "unchanged"
    static std::string status_to_string(RedactionStatus status) {
        switch (status) {
            case RedactionStatus::sanitized:
                return "sanitized";
            case RedactionStatus::unchanged:
                return "unchanged";
            default:
                return "unchanged";
        }
    }

    static std::string reason_to_string(FallbackReason reason) {
        switch (reason) {
            case FallbackReason::none:
                return "NONE";
            case FallbackReason::malformed_url:
                return "MALFORMED_URL";
            case FallbackReason::malformed_json:
                return "MALFORMED_JSON";
            case FallbackReason::serialization_failed:
                return "SERIALIZATION_FAILED";
            default:
                return "UNKNOWN_REASON";
        }
    }
};

} // namespace redaction
} // namespace confvault
