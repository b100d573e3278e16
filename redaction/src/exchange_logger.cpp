#include "confvault/redaction/exchange_logger.hpp"
#include "confvault/redaction/feature_flags.hpp"

namespace confvault {
namespace redaction {

using json = nlohmann::json;

ExchangeLogger::ExchangeLogger(Observability& observability, const Redactor& redactor)
    : ExchangeLogger(observability, redactor, FeatureFlags::is_debug_logging_enabled()) {}

ExchangeLogger::ExchangeLogger(Observability& observability, const Redactor& redactor, bool debug_enabled)
    : observability_(observability),
      redactor_(redactor),
      debug_enabled_(debug_enabled) {}

void ExchangeLogger::log_request(const std::string& method,
                                 const std::string& url,
                                 const HeaderMap& headers,
                                 const std::string& body) {
    if (!debug_enabled_) {
        return;
    }

    json redacted;
    redacted["method"] = method;
    redacted["url"] = redactor_.redact_url_query(url);
    redacted["headers"] = headers_to_json(redactor_.redact_http_headers(headers));
    if (!body.empty()) {
        redacted["body"] = redactor_.redact_bytes_chain(body);
    }

    observability_.log_redacted(LogLevel::debug, "HTTP request", {}, redacted);
}

void ExchangeLogger::log_response(int status_code,
                                  const HeaderMap& headers,
                                  const std::string& body) {
    if (!debug_enabled_) {
        return;
    }

    json redacted;
    redacted["status"] = status_code;
    redacted["headers"] = headers_to_json(redactor_.redact_http_headers(headers));
    if (!body.empty()) {
        redacted["body"] = redactor_.redact_bytes_chain(body);
    }

    observability_.log_redacted(LogLevel::debug, "HTTP response", {}, redacted);
}

void ExchangeLogger::log_failure(const std::string& operation,
                                 int status_code,
                                 const std::string& body) {
    json redacted;
    redacted["status"] = status_code;
    redacted["body"] = redactor_.redact_bytes_chain(body);

    observability_.log_redacted(LogLevel::error, "HTTP request failed", {
        {"operation", operation}
    }, redacted);
}

void ExchangeLogger::log_transport_error(const std::string& operation, const std::string& error) {
    json redacted;
    redacted["error"] = redactor_.redact_bytes_chain(error);

    observability_.log_redacted(LogLevel::error, "HTTP transport error", {
        {"operation", operation}
    }, redacted);
}

json ExchangeLogger::headers_to_json(const HeaderMap& headers) const {
    json out = json::object();
    for (const auto& [name, values] : headers) {
        out[name] = values;
    }
    return out;
}

} // namespace redaction
} // namespace confvault
