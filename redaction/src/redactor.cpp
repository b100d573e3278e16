#include "confvault/redaction/redactor.hpp"
#include "confvault/redaction/observability.hpp"
#include "confvault/redaction/result_converter.hpp"
#include <utility>
#include <vector>

namespace confvault {
namespace redaction {

using json = nlohmann::json;

// U+2026 HORIZONTAL ELLIPSIS
static const char* const PREVIEW_ELLIPSIS = "\xE2\x80\xA6";

Redactor::Redactor(SensitivityPolicy policy, Observability* observability)
    : policy_(std::move(policy)),
      observability_(observability),
      fallback_warnings_(FeatureFlags::is_fallback_warnings_enabled()) {}

Redactor Redactor::from_config(const RedactionConfig& config, Observability* observability) {
    SensitivityPolicy policy = SensitivityPolicy::defaults();
    for (const auto& key : config.extra_sensitive_keys) {
        if (!key.empty()) {
            policy = policy.with_substring(key);
        }
    }

    Redactor redactor(std::move(policy), observability);
    redactor.fallback_warnings_ = config.fallback_warnings;
    return redactor;
}

bool Redactor::is_sensitive_key(const std::string& key) const {
    return policy_.is_sensitive(key);
}

std::string Redactor::truncate_preview(const std::string& value) {
    // Offsets of UTF-8 lead bytes; continuation bytes never start a character
    std::vector<size_t> starts;
    starts.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            starts.push_back(i);
        }
    }

    if (starts.size() <= PREVIEW_WINDOW) {
        return value;
    }

    const size_t half = PREVIEW_WINDOW / 2;
    size_t head_end = starts[half];
    size_t tail_begin = starts[starts.size() - half];

    std::string preview = value.substr(0, head_end);
    preview += PREVIEW_ELLIPSIS;
    preview += value.substr(tail_begin);
    return preview;
}

std::string Redactor::safe_string(const std::string& key, const std::string& value) const {
    if (is_sensitive_key(key)) {
        return REDACTION_MASK;
    }
    return truncate_preview(value);
}

json Redactor::safe_value(const std::string& key, const json& value) const {
    if (is_sensitive_key(key)) {
        return REDACTION_MASK;
    }
    if (value.is_string()) {
        return truncate_preview(value.get_ref<const std::string&>());
    }
    return value;
}

json Redactor::safe_fields(const json& fields) const {
    if (!fields.is_object()) {
        return walk_field_node(fields);
    }

    json out = json::object();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (value.is_object()) {
            // Nested maps are always descended so deeper sensitive keys are found
            out[key] = safe_fields(value);
        } else if (value.is_array()) {
            out[key] = is_sensitive_key(key) ? json(REDACTION_MASK) : walk_field_node(value);
        } else {
            out[key] = safe_value(key, value);
        }
    }
    return out;
}

// Keyless node: sequence elements and non-object roots
json Redactor::walk_field_node(const json& node) const {
    if (node.is_object()) {
        return safe_fields(node);
    }
    if (node.is_array()) {
        json out = json::array();
        for (const auto& item : node) {
            out.push_back(walk_field_node(item));
        }
        return out;
    }
    if (node.is_string()) {
        return truncate_preview(node.get_ref<const std::string&>());
    }
    return node;
}

FieldMap Redactor::safe_context(const FieldMap& fields) const {
    FieldMap out;
    out.reserve(fields.size());
    for (const auto& [key, value] : fields) {
        out.emplace(key, safe_string(key, value));
    }
    return out;
}

std::string Redactor::safe_kv_string(const json& fields) const {
    json safe = safe_fields(fields);
    if (!safe.is_object()) {
        return "";
    }

    std::string rendered;
    bool first = true;
    for (auto it = safe.begin(); it != safe.end(); ++it) {
        if (!first) {
            rendered += " ";
        }
        first = false;

        rendered += it.key();
        rendered += "=";
        if (it.value().is_string()) {
            rendered += it.value().get_ref<const std::string&>();
        } else {
            rendered += it.value().dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }
    return rendered;
}

void Redactor::report(const char* adapter, RedactionStatus status, FallbackReason reason) const {
    if (observability_ == nullptr) {
        return;
    }

    observability_->record_operation(adapter, ResultConverter::status_to_string(status));

    if (status == RedactionStatus::unchanged && fallback_warnings_) {
        observability_->log_warn("Redaction fell back to unchanged input", {
            {"adapter", adapter},
            {"reason", ResultConverter::reason_to_string(reason)}
        });
    }
}

void Redactor::report_collapsed(const char* adapter) const {
    if (observability_ == nullptr) {
        return;
    }
    observability_->record_operation(adapter, "collapsed");
}

const Redactor& default_redactor() {
    static const Redactor redactor(SensitivityPolicy::defaults());
    return redactor;
}

bool is_sensitive_key(const std::string& key) {
    return default_redactor().is_sensitive_key(key);
}

std::string truncate_preview(const std::string& value) {
    return Redactor::truncate_preview(value);
}

json safe_value(const std::string& key, const json& value) {
    return default_redactor().safe_value(key, value);
}

json safe_fields(const json& fields) {
    return default_redactor().safe_fields(fields);
}

HeaderMap redact_http_headers(const HeaderMap& headers) {
    return default_redactor().redact_http_headers(headers);
}

std::string redact_url_query(const std::string& raw_url,
                             const std::vector<std::string>& extra_sensitive_keys) {
    return default_redactor().redact_url_query(raw_url, extra_sensitive_keys);
}

std::string redact_json_bytes(const std::string& body) {
    return default_redactor().redact_json_bytes(body);
}

std::string redact_pem(const std::string& text) {
    return default_redactor().redact_pem(text);
}

std::string redact_bytes_chain(const std::string& body) {
    return default_redactor().redact_bytes_chain(body);
}

std::string safe_kv_string(const json& fields) {
    return default_redactor().safe_kv_string(fields);
}

} // namespace redaction
} // namespace confvault
