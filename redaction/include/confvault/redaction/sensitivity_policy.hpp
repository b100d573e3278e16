#pragma once

#include <string>
#include <vector>

namespace confvault {
namespace redaction {

/**
 * Classification policy for field, header and query-parameter names.
 *
 * A name is sensitive when any pattern matches its lower-cased form:
 * - substring patterns match anywhere in the name ("ApiKeyValue" hits "key")
 * - exact patterns match the whole name only
 *
 * Matching is over-inclusive. Policies are immutable; the
 * with_* / without helpers return modified copies.
 */
class SensitivityPolicy {
public:
    enum class MatchMode {
        substring,
        exact
    };

    struct Pattern {
        std::string text;  // Lower-cased
        MatchMode mode = MatchMode::substring;

        bool operator==(const Pattern& other) const {
            return text == other.text && mode == other.mode;
        }
    };

    // Throws std::invalid_argument on an empty pattern
    explicit SensitivityPolicy(std::vector<Pattern> patterns);

    /**
     * Default vocabulary:
     * token, secret, password, passwd, apikey, api_key, authorization, auth,
     * credential, private, key, cert, certificate, pem, jwt, bearer, value
     */
    static const SensitivityPolicy& defaults();

    bool is_sensitive(const std::string& name) const;

    SensitivityPolicy with_substring(const std::string& pattern) const;
    SensitivityPolicy with_exact(const std::string& pattern) const;
    SensitivityPolicy without(const std::string& pattern) const;

    const std::vector<Pattern>& patterns() const { return patterns_; }

private:
    std::vector<Pattern> patterns_;

    static Pattern normalize(const std::string& text, MatchMode mode);
};

// ASCII lower-casing shared by the classifier and the adapters
std::string to_lower(const std::string& value);

// Case-insensitive ASCII equality
bool equals_ignore_case(const std::string& a, const std::string& b);

} // namespace redaction
} // namespace confvault
