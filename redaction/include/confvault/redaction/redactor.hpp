#pragma once

#include "confvault/redaction/core.hpp"
#include "confvault/redaction/feature_flags.hpp"
#include "confvault/redaction/sensitivity_policy.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace confvault {
namespace redaction {

class Observability;

/**
 * Redaction engine bound to one SensitivityPolicy.
 *
 * All operations are pure functions of their arguments and the policy; the
 * caller's data is never modified. The optional Observability sink only
 * receives adapter outcomes (never payloads).
 */
class Redactor {
public:
    explicit Redactor(SensitivityPolicy policy = SensitivityPolicy::defaults(),
                      Observability* observability = nullptr);

    // Default policy extended with config.extra_sensitive_keys
    static Redactor from_config(const RedactionConfig& config,
                                Observability* observability = nullptr);

    const SensitivityPolicy& policy() const { return policy_; }

    // Key Classifier
    bool is_sensitive_key(const std::string& key) const;

    // Scalar Redactor
    static std::string truncate_preview(const std::string& value);
    std::string safe_string(const std::string& key, const std::string& value) const;
    nlohmann::json safe_value(const std::string& key, const nlohmann::json& value) const;

    // Structural Walker
    nlohmann::json safe_fields(const nlohmann::json& fields) const;
    FieldMap safe_context(const FieldMap& fields) const;

    // Format adapters
    HeaderMap redact_http_headers(const HeaderMap& headers) const;

    std::string redact_url_query(const std::string& raw_url,
                                 const std::vector<std::string>& extra_sensitive_keys = {}) const;
    RedactionResult<std::string> redact_url_query_checked(
        const std::string& raw_url,
        const std::vector<std::string>& extra_sensitive_keys = {}) const;

    std::string redact_json_bytes(const std::string& body) const;
    RedactionResult<std::string> redact_json_bytes_checked(const std::string& body) const;

    std::string redact_pem(const std::string& text) const;

    // Chain Sanitizer. The checked variant reports `unchanged` when the JSON
    // stage fell back and only the PEM and keyword stages applied; value is
    // then the output of those stages, not the raw input.
    std::string redact_bytes_chain(const std::string& body) const;
    RedactionResult<std::string> redact_bytes_chain_checked(const std::string& body) const;

    // Key-Value String Renderer
    std::string safe_kv_string(const nlohmann::json& fields) const;

private:
    SensitivityPolicy policy_;
    Observability* observability_;
    bool fallback_warnings_;

    nlohmann::json walk_field_node(const nlohmann::json& node) const;
    nlohmann::json redact_json_node(const nlohmann::json& node) const;

    void report(const char* adapter, RedactionStatus status, FallbackReason reason) const;
    void report_collapsed(const char* adapter) const;
};

// Default-policy conveniences
const Redactor& default_redactor();

bool is_sensitive_key(const std::string& key);
std::string truncate_preview(const std::string& value);
nlohmann::json safe_value(const std::string& key, const nlohmann::json& value);
nlohmann::json safe_fields(const nlohmann::json& fields);
HeaderMap redact_http_headers(const HeaderMap& headers);
std::string redact_url_query(const std::string& raw_url,
                             const std::vector<std::string>& extra_sensitive_keys = {});
std::string redact_json_bytes(const std::string& body);
std::string redact_pem(const std::string& text);
std::string redact_bytes_chain(const std::string& body);
std::string safe_kv_string(const nlohmann::json& fields);

} // namespace redaction
} // namespace confvault
