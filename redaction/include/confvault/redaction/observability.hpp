#pragma once

#include "confvault/redaction/core.hpp"
#include "confvault/redaction/feature_flags.hpp"
#include "confvault/redaction/redactor.hpp"
#include <prometheus/counter.h>
#include <prometheus/registry.h>
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace confvault {
namespace redaction {

enum class LogLevel {
    error,
    warn,
    info,
    debug
};

class Observability {
public:
    explicit Observability(const std::string& component_id);
    explicit Observability(const RedactionConfig& config);

    // Sinks must outlive the instance
    Observability(const RedactionConfig& config, std::ostream& out, std::ostream& err);

    // Metrics
    void record_operation(const std::string& adapter, const std::string& outcome);
    std::string get_metrics_response(); // Prometheus text format
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Logging. Context values go through the Structural Walker before output.
    void log_info(const std::string& message, const FieldMap& context = {});
    void log_warn(const std::string& message, const FieldMap& context = {});
    void log_error(const std::string& message, const FieldMap& context = {});
    void log_debug(const std::string& message, const FieldMap& context = {});

    // `redacted` must already be adapter output; it is emitted as-is under "redacted"
    void log_redacted(LogLevel level,
                      const std::string& message,
                      const FieldMap& context,
                      const nlohmann::json& redacted);

    const std::string& component_id() const { return component_id_; }
    bool metrics_enabled() const { return metrics_enabled_; }

private:
    std::string component_id_;
    bool metrics_enabled_;
    std::ostream* out_;
    std::ostream* err_;
    std::mutex write_mutex_;

    // Scrubs log context with the configured policy; has no sink of its own
    Redactor context_redactor_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* operations_family_{nullptr};

    void initialize_metrics();
    void write(LogLevel level, const std::string& line);
    std::string format_json_log(LogLevel level,
                                const std::string& message,
                                const FieldMap& context,
                                const nlohmann::json* redacted);
};

std::string log_level_to_string(LogLevel level);

} // namespace redaction
} // namespace confvault
