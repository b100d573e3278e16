#include "confvault/redaction/observability.hpp"
#include <prometheus/text_serializer.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace confvault {
namespace redaction {

using json = nlohmann::json;

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::error:
            return "ERROR";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::info:
            return "INFO";
        case LogLevel::debug:
            return "DEBUG";
    }
    return "INFO";
}

Observability::Observability(const std::string& component_id)
    : Observability([&component_id] {
          RedactionConfig config = RedactionConfig::from_env();
          config.component_id = component_id;
          return config;
      }()) {}

Observability::Observability(const RedactionConfig& config)
    : Observability(config, std::cout, std::cerr) {}

Observability::Observability(const RedactionConfig& config, std::ostream& out, std::ostream& err)
    : component_id_(config.component_id),
      metrics_enabled_(config.metrics_enabled),
      out_(&out),
      err_(&err),
      context_redactor_(Redactor::from_config(config)) {
    initialize_metrics();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    operations_family_ = &prometheus::BuildCounter()
        .Name("confvault_redaction_operations_total")
        .Help("Redaction adapter calls by outcome")
        .Labels({{"component_id", component_id_}})
        .Register(*registry_);
}

void Observability::record_operation(const std::string& adapter, const std::string& outcome) {
    if (!metrics_enabled_) {
        return;
    }

    auto& counter = operations_family_->Add({
        {"adapter", adapter},
        {"outcome", outcome}
    });
    counter.Increment();
}

std::string Observability::get_metrics_response() {
    if (!metrics_enabled_) {
        return "";
    }

    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void Observability::log_info(const std::string& message, const FieldMap& context) {
    write(LogLevel::info, format_json_log(LogLevel::info, message, context, nullptr));
}

void Observability::log_warn(const std::string& message, const FieldMap& context) {
    write(LogLevel::warn, format_json_log(LogLevel::warn, message, context, nullptr));
}

void Observability::log_error(const std::string& message, const FieldMap& context) {
    write(LogLevel::error, format_json_log(LogLevel::error, message, context, nullptr));
}

void Observability::log_debug(const std::string& message, const FieldMap& context) {
    write(LogLevel::debug, format_json_log(LogLevel::debug, message, context, nullptr));
}

void Observability::log_redacted(LogLevel level,
                                 const std::string& message,
                                 const FieldMap& context,
                                 const json& redacted) {
    write(level, format_json_log(level, message, context, &redacted));
}

void Observability::write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::ostream& sink = (level == LogLevel::error) ? *err_ : *out_;
    sink << line << std::endl;
}

std::string Observability::format_json_log(LogLevel level,
                                           const std::string& message,
                                           const FieldMap& context,
                                           const json* redacted) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = log_level_to_string(level);
    log_entry["component"] = "redaction";
    log_entry["message"] = message;

    // Context object (technical details)
    json context_obj = json::object();
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    // Scrub context before it is written anywhere
    context_obj = context_redactor_.safe_fields(context_obj);
    context_obj["component_id"] = component_id_;
    log_entry["context"] = context_obj;

    if (redacted != nullptr && !redacted->is_null()) {
        log_entry["redacted"] = *redacted;
    }

    // Invalid UTF-8 in a message must not take down the logging path
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace redaction
} // namespace confvault
