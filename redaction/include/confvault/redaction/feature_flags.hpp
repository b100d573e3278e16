#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace confvault {
namespace redaction {

/**
 * Redaction Feature Flags
 *
 * Everything beyond the redaction itself is opt-in. Flags default to `false`
 * and are read from environment variables:
 * - CONFVAULT_REDACTION_FALLBACK_WARNINGS
 * - CONFVAULT_REDACTION_METRICS_ENABLED
 * - CONFVAULT_REDACTION_DEBUG_LOGGING
 *
 * CONFVAULT_REDACTION_EXTRA_KEYS holds a comma-separated list of additional
 * sensitive names.
 */
class FeatureFlags {
public:
    /**
     * Log a WARN entry whenever an adapter fails open and returns its
     * input unchanged. Only the adapter and reason are logged.
     */
    static bool is_fallback_warnings_enabled() {
        return get_env_bool("CONFVAULT_REDACTION_FALLBACK_WARNINGS", false);
    }

    /**
     * Record prometheus counters for every adapter call
     */
    static bool is_metrics_enabled() {
        return get_env_bool("CONFVAULT_REDACTION_METRICS_ENABLED", false);
    }

    /**
     * Emit DEBUG request/response entries from ExchangeLogger
     */
    static bool is_debug_logging_enabled() {
        return get_env_bool("CONFVAULT_REDACTION_DEBUG_LOGGING", false);
    }

    /**
     * Extra sensitive names, trimmed, empty items dropped
     */
    static std::vector<std::string> extra_sensitive_keys() {
        return get_env_list("CONFVAULT_REDACTION_EXTRA_KEYS");
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `default_value` if environment variable is not set or has other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }

    static std::vector<std::string> get_env_list(const char* env_var) {
        std::vector<std::string> items;
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return items;
        }

        std::string raw(value);
        size_t start = 0;
        while (start <= raw.size()) {
            size_t comma = raw.find(',', start);
            if (comma == std::string::npos) {
                comma = raw.size();
            }
            std::string item = raw.substr(start, comma - start);

            auto not_space = [](unsigned char c) { return !std::isspace(c); };
            item.erase(item.begin(), std::find_if(item.begin(), item.end(), not_space));
            item.erase(std::find_if(item.rbegin(), item.rend(), not_space).base(), item.end());

            if (!item.empty()) {
                items.push_back(item);
            }
            start = comma + 1;
        }
        return items;
    }
};

// Redaction configuration
struct RedactionConfig {
    std::string component_id = "confvault";
    bool fallback_warnings = false;
    bool metrics_enabled = false;
    bool debug_logging = false;
    std::vector<std::string> extra_sensitive_keys;

    static RedactionConfig from_env() {
        RedactionConfig config;
        config.fallback_warnings = FeatureFlags::is_fallback_warnings_enabled();
        config.metrics_enabled = FeatureFlags::is_metrics_enabled();
        config.debug_logging = FeatureFlags::is_debug_logging_enabled();
        config.extra_sensitive_keys = FeatureFlags::extra_sensitive_keys();
        return config;
    }
};

} // namespace redaction
} // namespace confvault
