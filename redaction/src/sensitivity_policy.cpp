#include "confvault/redaction/sensitivity_policy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace confvault {
namespace redaction {

std::string to_lower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

SensitivityPolicy::SensitivityPolicy(std::vector<Pattern> patterns) {
    patterns_.reserve(patterns.size());
    for (auto& pattern : patterns) {
        Pattern normalized = normalize(pattern.text, pattern.mode);
        if (std::find(patterns_.begin(), patterns_.end(), normalized) == patterns_.end()) {
            patterns_.push_back(std::move(normalized));
        }
    }
}

const SensitivityPolicy& SensitivityPolicy::defaults() {
    static const SensitivityPolicy policy({
        {"token", MatchMode::substring},
        {"secret", MatchMode::substring},
        {"password", MatchMode::substring},
        {"passwd", MatchMode::substring},
        {"apikey", MatchMode::substring},
        {"api_key", MatchMode::substring},
        {"authorization", MatchMode::substring},
        {"auth", MatchMode::substring},
        {"credential", MatchMode::substring},
        {"private", MatchMode::substring},
        {"key", MatchMode::substring},
        {"cert", MatchMode::substring},
        {"certificate", MatchMode::substring},
        {"pem", MatchMode::substring},
        {"jwt", MatchMode::substring},
        {"bearer", MatchMode::substring},
        {"value", MatchMode::substring}
    });
    return policy;
}

bool SensitivityPolicy::is_sensitive(const std::string& name) const {
    std::string lower_name = to_lower(name);

    for (const auto& pattern : patterns_) {
        if (pattern.mode == MatchMode::exact) {
            if (lower_name == pattern.text) {
                return true;
            }
        } else if (lower_name.find(pattern.text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

SensitivityPolicy SensitivityPolicy::with_substring(const std::string& pattern) const {
    std::vector<Pattern> extended = patterns_;
    extended.push_back({pattern, MatchMode::substring});
    return SensitivityPolicy(std::move(extended));
}

SensitivityPolicy SensitivityPolicy::with_exact(const std::string& pattern) const {
    std::vector<Pattern> extended = patterns_;
    extended.push_back({pattern, MatchMode::exact});
    return SensitivityPolicy(std::move(extended));
}

SensitivityPolicy SensitivityPolicy::without(const std::string& pattern) const {
    std::string lower_pattern = to_lower(pattern);
    std::vector<Pattern> restricted;
    restricted.reserve(patterns_.size());
    for (const auto& existing : patterns_) {
        if (existing.text != lower_pattern) {
            restricted.push_back(existing);
        }
    }
    return SensitivityPolicy(std::move(restricted));
}

SensitivityPolicy::Pattern SensitivityPolicy::normalize(const std::string& text, MatchMode mode) {
    // An empty substring would classify every name as sensitive
    if (text.empty()) {
        throw std::invalid_argument("sensitivity pattern must not be empty");
    }
    return Pattern{to_lower(text), mode};
}

} // namespace redaction
} // namespace confvault
