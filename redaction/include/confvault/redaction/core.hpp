#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace confvault {
namespace redaction {

// Sentinel substituted for every value classified as sensitive
inline constexpr const char* REDACTION_MASK = "****";

// Strings longer than this (in UTF-8 code points) are shortened to a preview
inline constexpr std::size_t PREVIEW_WINDOW = 16;

// Collaborator shapes
using HeaderMap = std::map<std::string, std::vector<std::string>>;
using FieldMap = std::unordered_map<std::string, std::string>;

// Outcome of a fail-open adapter
enum class RedactionStatus {
    sanitized,  // Input was parsed and redacted
    unchanged   // Input could not be parsed and is returned verbatim
};

// Why an adapter fell back to returning its input
enum class FallbackReason {
    none = 0,
    malformed_url = 1001,
    malformed_json = 1002,
    serialization_failed = 1003
};

// Result of an adapter call that may fail open.
// value always holds something printable: the redacted output when sanitized,
// the original input when unchanged.
template <typename T>
struct RedactionResult {
    RedactionStatus status = RedactionStatus::sanitized;
    FallbackReason reason = FallbackReason::none;
    T value{};
    std::string detail;  // Parser message, never payload content

    bool is_sanitized() const { return status == RedactionStatus::sanitized; }
    bool is_unchanged() const { return status == RedactionStatus::unchanged; }

    static RedactionResult sanitized(T value) {
        RedactionResult result;
        result.status = RedactionStatus::sanitized;
        result.reason = FallbackReason::none;
        result.value = std::move(value);
        return result;
    }

    static RedactionResult unchanged(T original, FallbackReason reason,
                                     const std::string& detail = "") {
        RedactionResult result;
        result.status = RedactionStatus::unchanged;
        result.reason = reason;
        result.value = std::move(original);
        result.detail = detail;
        return result;
    }
};

} // namespace redaction
} // namespace confvault
