#include <iostream>
#include <cassert>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include "confvault/redaction/core.hpp"
#include "confvault/redaction/feature_flags.hpp"
#include "confvault/redaction/redactor.hpp"
#include "confvault/redaction/result_converter.hpp"
#include "confvault/redaction/sensitivity_policy.hpp"
#include <nlohmann/json.hpp>

using namespace confvault::redaction;
using json = nlohmann::json;

static const std::string ELLIPSIS = "\xE2\x80\xA6";

// Count UTF-8 code points
static size_t code_points(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

void test_default_vocabulary() {
    std::cout << "Testing default sensitivity vocabulary..." << std::endl;

    const auto& policy = SensitivityPolicy::defaults();
    assert(policy.patterns().size() == 17);

    std::vector<std::string> sensitive = {
        "token", "access_token", "X-Auth-Token", "client_secret", "PASSWORD",
        "db_passwd", "apikey", "Api_Key", "Authorization", "oauth_state",
        "credentials", "my_private_note", "ApiKeyValue", "tls_cert",
        "certificate_chain", "pem_bundle", "jwt", "BearerToken", "value"
    };
    for (const auto& name : sensitive) {
        assert(policy.is_sensitive(name));
        assert(is_sensitive_key(name));
    }

    std::vector<std::string> plain = {
        "page", "name", "id", "Content-Type", "pwd_temp", "status", "", "limit"
    };
    for (const auto& name : plain) {
        assert(!policy.is_sensitive(name));
    }

    std::cout << "✓ Default vocabulary test passed" << std::endl;
}

void test_policy_injection() {
    std::cout << "Testing policy extension and restriction..." << std::endl;

    auto extended = SensitivityPolicy::defaults().with_substring("PWD").with_exact("sid");
    assert(extended.is_sensitive("pwd_temp"));
    assert(extended.is_sensitive("SID"));
    assert(!extended.is_sensitive("sidebar"));
    assert(!SensitivityPolicy::defaults().is_sensitive("pwd_temp"));

    auto restricted = SensitivityPolicy::defaults().without("value");
    assert(!restricted.is_sensitive("value"));
    assert(restricted.is_sensitive("token"));

    // Duplicates collapse, order is kept
    SensitivityPolicy custom({{"Alpha", SensitivityPolicy::MatchMode::substring},
                              {"alpha", SensitivityPolicy::MatchMode::substring},
                              {"beta", SensitivityPolicy::MatchMode::exact}});
    assert(custom.patterns().size() == 2);
    assert(custom.patterns()[0].text == "alpha");
    assert(custom.patterns()[1].mode == SensitivityPolicy::MatchMode::exact);

    bool threw = false;
    try {
        SensitivityPolicy::defaults().with_substring("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    Redactor redactor(SensitivityPolicy({{"ssn", SensitivityPolicy::MatchMode::exact}}));
    assert(redactor.safe_string("ssn", "123-45-6789") == REDACTION_MASK);
    assert(redactor.safe_string("token", "abc") == "abc");

    std::cout << "✓ Policy injection test passed" << std::endl;
}

void test_truncate_preview() {
    std::cout << "Testing preview window..." << std::endl;

    assert(truncate_preview("") == "");
    assert(truncate_preview("short") == "short");
    assert(truncate_preview("exactly16chars!!") == "exactly16chars!!");

    std::string seventeen = "abcdefghijklmnopq";
    assert(truncate_preview(seventeen) == "abcdefgh" + ELLIPSIS + "jklmnopq");

    std::string long_value = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string preview = truncate_preview(long_value);
    assert(preview == "01234567" + ELLIPSIS + "stuvwxyz");
    assert(code_points(preview) == 17);
    assert(code_points(preview) < code_points(long_value));

    // Multibyte characters are never split
    std::string cyrillic = "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82"   // Привет
                           "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82"   // Привет
                           "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";  // Привет
    std::string cyrillic_preview = truncate_preview(cyrillic);
    assert(code_points(cyrillic_preview) == 17);
    assert(json(cyrillic_preview).dump().size() > 0);

    // Previews are stable under re-application
    assert(truncate_preview(preview) == preview);

    std::cout << "✓ Preview window test passed" << std::endl;
}

void test_scalar_redactor() {
    std::cout << "Testing scalar redactor..." << std::endl;

    assert(safe_value("password", "hunter2") == REDACTION_MASK);
    assert(safe_value("api_key", 12345) == REDACTION_MASK);
    assert(safe_value("token", nullptr) == REDACTION_MASK);
    assert(safe_value("secret", json::object({{"a", 1}})) == REDACTION_MASK);

    assert(safe_value("name", "alice") == "alice");
    assert(safe_value("description", "0123456789abcdefghijklmnopqrstuvwxyz") ==
           "01234567" + ELLIPSIS + "stuvwxyz");
    assert(safe_value("count", 42) == 42);
    assert(safe_value("enabled", true) == true);
    assert(safe_value("ratio", 0.5) == 0.5);
    assert(safe_value("missing", nullptr).is_null());

    const Redactor& redactor = default_redactor();
    assert(redactor.safe_string("Authorization", "Bearer abc") == REDACTION_MASK);
    assert(redactor.safe_string("region", "eu-west-1") == "eu-west-1");

    std::cout << "✓ Scalar redactor test passed" << std::endl;
}

void test_structural_walker() {
    std::cout << "Testing structural walker..." << std::endl;

    json input = {
        {"name", "service-a"},
        {"password", "p@ss"},
        {"port", 8443},
        {"nested", {
            {"client_secret", "abc"},
            {"endpoint", "https://config.example.com/v1/secrets"},
            {"deeper", {{"jwt", "eyJ"}, {"enabled", false}}}
        }},
        {"credentials", {{"user", "bob"}}},
        {"tags", {"a", "0123456789abcdefghijklmnopqrstuvwxyz", 3, {{"token", "x"}}}},
        {"tokens", {"t1", "t2"}}
    };
    json before = input;

    json out = safe_fields(input);

    // Input untouched
    assert(input == before);

    // Same key set at every level
    assert(out.size() == input.size());
    for (auto it = input.begin(); it != input.end(); ++it) {
        assert(out.contains(it.key()));
    }
    assert(out["nested"].size() == input["nested"].size());
    assert(out["nested"]["deeper"].size() == 2);

    assert(out["name"] == "service-a");
    assert(out["password"] == REDACTION_MASK);
    assert(out["port"] == 8443);
    assert(out["nested"]["client_secret"] == REDACTION_MASK);
    assert(out["nested"]["endpoint"] == "https://" + ELLIPSIS + "/secrets");
    assert(out["nested"]["deeper"]["jwt"] == REDACTION_MASK);
    assert(out["nested"]["deeper"]["enabled"] == false);

    // Maps under a sensitive key are still walked
    assert(out["credentials"].is_object());
    assert(out["credentials"]["user"] == "bob");

    // Sequence elements are walked without a key
    assert(out["tags"].size() == 4);
    assert(out["tags"][0] == "a");
    assert(out["tags"][1] == "01234567" + ELLIPSIS + "stuvwxyz");
    assert(out["tags"][2] == 3);
    assert(out["tags"][3]["token"] == REDACTION_MASK);

    // A sequence under a sensitive key is masked
    assert(out["tokens"] == REDACTION_MASK);

    std::cout << "✓ Structural walker test passed" << std::endl;
}

void test_walker_flat_context() {
    std::cout << "Testing walker over flat string context..." << std::endl;

    FieldMap context = {
        {"api_key", "sk-1234567890abcdef"},
        {"status", "success"},
        {"latency_ms", "150"},
        {"request_path", "/v1/configs/payments/entries/database"}
    };
    FieldMap out = default_redactor().safe_context(context);

    assert(out.size() == context.size());
    assert(out["api_key"] == REDACTION_MASK);
    assert(out["status"] == "success");
    assert(out["latency_ms"] == "150");
    assert(out["request_path"] == "/v1/conf" + ELLIPSIS + "database");
    assert(context["api_key"] == "sk-1234567890abcdef");

    std::cout << "✓ Flat context walker test passed" << std::endl;
}

void test_walker_non_object_root() {
    std::cout << "Testing walker on non-object roots..." << std::endl;

    assert(safe_fields(json("0123456789abcdefghijklmnopqrstuvwxyz")) == "01234567" + ELLIPSIS + "stuvwxyz");
    assert(safe_fields(json(7)) == 7);
    json arr = safe_fields(json::array({json::object({{"secret", 1}}), "ok"}));
    assert(arr[0]["secret"] == REDACTION_MASK);
    assert(arr[1] == "ok");

    std::cout << "✓ Non-object root test passed" << std::endl;
}

void test_safe_kv_string() {
    std::cout << "Testing key-value renderer..." << std::endl;

    json fields = {
        {"attempt", 2},
        {"name", "db"},
        {"token", "abc"},
        {"meta", {{"ok", true}}}
    };
    std::string rendered = safe_kv_string(fields);

    // JSON objects iterate in key order
    assert(rendered == "attempt=2 meta={\"ok\":true} name=db token=****");

    assert(safe_kv_string(json::object()) == "");
    assert(safe_kv_string(json("not a map")) == "");

    std::cout << "✓ Key-value renderer test passed" << std::endl;
}

void test_result_converter() {
    std::cout << "Testing result converter..." << std::endl;

    assert(ResultConverter::status_to_string(RedactionStatus::sanitized) == "sanitized");
    assert(ResultConverter::status_to_string(RedactionStatus::unchanged) == "unchanged");

    assert(ResultConverter::reason_to_string(FallbackReason::malformed_json) == "MALFORMED_JSON");
    assert(ResultConverter::reason_to_string(FallbackReason::malformed_url) == "MALFORMED_URL");
    assert(ResultConverter::reason_to_string(FallbackReason::none) == "NONE");

    auto result = RedactionResult<std::string>::unchanged("raw", FallbackReason::malformed_json, "at byte 1");
    assert(result.is_unchanged());
    assert(!result.is_sanitized());
    assert(result.value == "raw");
    assert(result.detail == "at byte 1");

    std::cout << "✓ Result converter test passed" << std::endl;
}

void test_config_from_env() {
    std::cout << "Testing configuration from environment..." << std::endl;

    setenv("CONFVAULT_REDACTION_EXTRA_KEYS", " pwd , ,session_id,", 1);
    setenv("CONFVAULT_REDACTION_FALLBACK_WARNINGS", "YES", 1);
    setenv("CONFVAULT_REDACTION_METRICS_ENABLED", "0", 1);
    unsetenv("CONFVAULT_REDACTION_DEBUG_LOGGING");

    RedactionConfig config = RedactionConfig::from_env();
    assert(config.extra_sensitive_keys.size() == 2);
    assert(config.extra_sensitive_keys[0] == "pwd");
    assert(config.extra_sensitive_keys[1] == "session_id");
    assert(config.fallback_warnings);
    assert(!config.metrics_enabled);
    assert(!config.debug_logging);

    Redactor redactor = Redactor::from_config(config);
    assert(redactor.is_sensitive_key("pwd_temp"));
    assert(redactor.is_sensitive_key("X-Session-Id") == false);
    assert(redactor.is_sensitive_key("session_id"));
    assert(redactor.is_sensitive_key("token"));

    unsetenv("CONFVAULT_REDACTION_EXTRA_KEYS");
    unsetenv("CONFVAULT_REDACTION_FALLBACK_WARNINGS");
    unsetenv("CONFVAULT_REDACTION_METRICS_ENABLED");
    assert(FeatureFlags::extra_sensitive_keys().empty());
    assert(!FeatureFlags::is_fallback_warnings_enabled());

    std::cout << "✓ Configuration test passed" << std::endl;
}

int main() {
    std::cout << "=== Redaction Core Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_default_vocabulary();
        test_policy_injection();
        test_truncate_preview();
        test_scalar_redactor();
        test_structural_walker();
        test_walker_flat_context();
        test_walker_non_object_root();
        test_safe_kv_string();
        test_result_converter();
        test_config_from_env();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
