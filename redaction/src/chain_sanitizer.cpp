#include "confvault/redaction/redactor.hpp"
#include <string>
#include <utility>

namespace confvault {
namespace redaction {

// Credential signals that force the whole buffer to the mask
static const char* const AUTHORIZATION_SIGNALS[] = {
    "authorization:",
    "bearer "
};

std::string Redactor::redact_bytes_chain(const std::string& body) const {
    return redact_bytes_chain_checked(body).value;
}

RedactionResult<std::string> Redactor::redact_bytes_chain_checked(const std::string& body) const {
    using Result = RedactionResult<std::string>;

    auto json_stage = redact_json_bytes_checked(body);
    std::string text = redact_pem(json_stage.value);

    std::string lower_text = to_lower(text);
    for (const char* signal : AUTHORIZATION_SIGNALS) {
        if (lower_text.find(signal) != std::string::npos) {
            report_collapsed("chain");
            return Result::sanitized(REDACTION_MASK);
        }
    }

    if (json_stage.is_unchanged()) {
        report("chain", RedactionStatus::unchanged, json_stage.reason);
        return Result::unchanged(std::move(text), json_stage.reason, json_stage.detail);
    }

    report("chain", RedactionStatus::sanitized, FallbackReason::none);
    return Result::sanitized(std::move(text));
}

} // namespace redaction
} // namespace confvault
