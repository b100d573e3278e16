#pragma once

#include "confvault/redaction/core.hpp"
#include "confvault/redaction/observability.hpp"
#include "confvault/redaction/redactor.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace confvault {
namespace redaction {

/**
 * Logging facade for HTTP client call sites.
 *
 * Every artifact is passed through the matching adapter before it reaches
 * Observability: URLs through redact_url_query, headers through
 * redact_http_headers, bodies and error text through redact_bytes_chain.
 * Request/response entries are DEBUG and only written when debug logging is
 * on; failures are always written at ERROR.
 */
class ExchangeLogger {
public:
    // Both references must outlive the logger
    ExchangeLogger(Observability& observability, const Redactor& redactor);
    ExchangeLogger(Observability& observability, const Redactor& redactor, bool debug_enabled);

    void log_request(const std::string& method,
                     const std::string& url,
                     const HeaderMap& headers,
                     const std::string& body = "");

    void log_response(int status_code,
                      const HeaderMap& headers,
                      const std::string& body = "");

    void log_failure(const std::string& operation,
                     int status_code,
                     const std::string& body);

    void log_transport_error(const std::string& operation, const std::string& error);

    bool debug_enabled() const { return debug_enabled_; }

private:
    Observability& observability_;
    const Redactor& redactor_;
    bool debug_enabled_;

    nlohmann::json headers_to_json(const HeaderMap& headers) const;
};

} // namespace redaction
} // namespace confvault
