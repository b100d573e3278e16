#include "confvault/redaction/redactor.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

namespace confvault {
namespace redaction {

using json = nlohmann::json;

namespace {

using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using CurlEasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Base for validating relative references; never appears in output
const char* const RELATIVE_BASE_URL = "http://placeholder.invalid/";

// Accept what a lenient URL parser accepts; only the authority is checked strictly
const unsigned int URL_PARSE_FLAGS = CURLU_NON_SUPPORT_SCHEME | CURLU_ALLOW_SPACE;

// Deeper JSON documents fail open instead of recursing without bound
const size_t MAX_JSON_DEPTH = 10000;

// U+FFFD REPLACEMENT CHARACTER
const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool ensure_curl_initialized() {
    static const bool initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    return initialized;
}

// RFC 3986 scheme followed by ':'
bool has_scheme(const std::string& raw) {
    if (raw.empty() || !std::isalpha(static_cast<unsigned char>(raw[0]))) {
        return false;
    }
    for (size_t i = 1; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c == ':') {
            return true;
        }
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return false;
}

// Form decoding: '+' is a space, then percent-escapes
std::string query_unescape(CURL* easy, const std::string& encoded) {
    std::string plus_decoded = encoded;
    for (auto& c : plus_decoded) {
        if (c == '+') {
            c = ' ';
        }
    }

    int decoded_length = 0;
    char* decoded = curl_easy_unescape(easy, plus_decoded.c_str(),
                                       static_cast<int>(plus_decoded.size()), &decoded_length);
    if (decoded == nullptr) {
        return plus_decoded;
    }
    std::string result(decoded, static_cast<size_t>(decoded_length));
    curl_free(decoded);
    return result;
}

std::string query_escape(CURL* easy, const std::string& value) {
    char* escaped = curl_easy_escape(easy, value.c_str(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        return REDACTION_MASK;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// Scheme followed by "//", i.e. the URL carries an authority component
bool has_authority(const std::string& raw) {
    size_t colon = raw.find(':');
    return colon != std::string::npos && raw.compare(colon + 1, 2, "//") == 0;
}

// Control bytes are rejected in every URL form
bool has_control_bytes(const std::string& raw) {
    for (unsigned char c : raw) {
        if (c < 0x20 || c == 0x7F) {
            return true;
        }
    }
    return false;
}

// Deepest object/array nesting outside string literals. Malformed input may
// produce any value; the parser rejects it later.
size_t json_nesting_depth(const std::string& body) {
    size_t depth = 0;
    size_t max_depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{' || c == '[') {
            max_depth = std::max(max_depth, ++depth);
        } else if ((c == '}' || c == ']') && depth > 0) {
            --depth;
        }
    }
    return max_depth;
}

// Length of the well-formed UTF-8 sequence at `pos`, or 0. Overlong forms,
// surrogates and code points above U+10FFFF are ill-formed.
size_t utf8_sequence_length(const std::string& text, size_t pos) {
    auto byte = [&text](size_t i) { return static_cast<unsigned char>(text[i]); };
    auto is_cont = [&byte](size_t i) { return (byte(i) & 0xC0) == 0x80; };

    unsigned char lead = byte(pos);
    size_t remaining = text.size() - pos;
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return (remaining >= 2 && is_cont(pos + 1)) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (remaining < 3 || !is_cont(pos + 1) || !is_cont(pos + 2)) {
            return 0;
        }
        unsigned char second = byte(pos + 1);
        if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F)) {
            return 0;
        }
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (remaining < 4 || !is_cont(pos + 1) || !is_cont(pos + 2) || !is_cont(pos + 3)) {
            return 0;
        }
        unsigned char second = byte(pos + 1);
        if ((lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
            return 0;
        }
        return 4;
    }
    return 0;
}

// Each ill-formed byte becomes U+FFFD so one stray Latin-1 byte does not
// keep the rest of the document from being redacted.
std::string replace_invalid_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = utf8_sequence_length(text, pos);
        if (length == 0) {
            out += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }
        out.append(text, pos, length);
        pos += length;
    }
    return out;
}

bool contains_ignore_case(const std::vector<std::string>& names, const std::string& name) {
    for (const auto& candidate : names) {
        if (equals_ignore_case(candidate, name)) {
            return true;
        }
    }
    return false;
}

// `pos` is just past "-----BEGIN " or "-----END ". Returns the offset after
// the closing "-----" of the label, or npos if the label is empty or unterminated.
size_t armor_label_end(const std::string& text, size_t pos) {
    size_t label_end = pos;
    while (label_end < text.size() && text[label_end] != '-') {
        ++label_end;
    }
    if (label_end == pos || text.compare(label_end, 5, "-----") != 0) {
        return std::string::npos;
    }
    return label_end + 5;
}

} // namespace

HeaderMap Redactor::redact_http_headers(const HeaderMap& headers) const {
    HeaderMap safe;
    for (const auto& [name, values] : headers) {
        if (is_sensitive_key(name) ||
            equals_ignore_case(name, "Authorization") ||
            equals_ignore_case(name, "Cookie")) {
            safe[name] = {REDACTION_MASK};
            continue;
        }

        std::vector<std::string> previews;
        previews.reserve(values.size());
        for (const auto& value : values) {
            previews.push_back(truncate_preview(value));
        }
        safe[name] = std::move(previews);
    }
    report("headers", RedactionStatus::sanitized, FallbackReason::none);
    return safe;
}

std::string Redactor::redact_url_query(const std::string& raw_url,
                                       const std::vector<std::string>& extra_sensitive_keys) const {
    return redact_url_query_checked(raw_url, extra_sensitive_keys).value;
}

RedactionResult<std::string> Redactor::redact_url_query_checked(
    const std::string& raw_url,
    const std::vector<std::string>& extra_sensitive_keys) const {
    using Result = RedactionResult<std::string>;

    auto fail_open = [&](const std::string& detail) {
        report("url", RedactionStatus::unchanged, FallbackReason::malformed_url);
        return Result::unchanged(raw_url, FallbackReason::malformed_url, detail);
    };

    if (!ensure_curl_initialized()) {
        return fail_open("libcurl initialization failed");
    }

    CurlUrlHandle url(curl_url(), &curl_url_cleanup);
    CurlEasyHandle easy(curl_easy_init(), &curl_easy_cleanup);
    if (!url || !easy) {
        return fail_open("libcurl handle allocation failed");
    }

    if (has_control_bytes(raw_url)) {
        return fail_open("control character in URL");
    }

    // Validate only; the output is spliced from raw_url so scheme, host, path
    // and fragment keep their exact original spelling. A scheme without "//"
    // ("localhost:8080/y", "mailto:ops") has no authority for libcurl to check.
    CURLUcode rc = CURLUE_OK;
    if (has_scheme(raw_url) && has_authority(raw_url)) {
        rc = curl_url_set(url.get(), CURLUPART_URL, raw_url.c_str(), URL_PARSE_FLAGS);
    } else if (!has_scheme(raw_url)) {
        rc = curl_url_set(url.get(), CURLUPART_URL, RELATIVE_BASE_URL, 0);
        if (rc == CURLUE_OK) {
            rc = curl_url_set(url.get(), CURLUPART_URL, raw_url.c_str(), URL_PARSE_FLAGS);
        }
    }
    if (rc != CURLUE_OK) {
        return fail_open(curl_url_strerror(rc));
    }

    size_t fragment_pos = raw_url.find('#');
    size_t query_pos = raw_url.find('?');
    if (query_pos == std::string::npos ||
        (fragment_pos != std::string::npos && query_pos > fragment_pos)) {
        report("url", RedactionStatus::sanitized, FallbackReason::none);
        return Result::sanitized(raw_url);
    }
    size_t query_end = (fragment_pos == std::string::npos) ? raw_url.size() : fragment_pos;
    std::string query = raw_url.substr(query_pos + 1, query_end - query_pos - 1);

    std::string rewritten;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        std::string pair = query.substr(start, amp - start);
        start = amp + 1;

        if (pair.empty()) {
            continue;
        }

        size_t eq = pair.find('=');
        std::string encoded_name = pair.substr(0, eq);
        std::string name = query_unescape(easy.get(), encoded_name);
        bool sensitive = is_sensitive_key(name) || contains_ignore_case(extra_sensitive_keys, name);

        if (!rewritten.empty()) {
            rewritten += "&";
        }
        rewritten += encoded_name;

        if (sensitive) {
            rewritten += "=";
            rewritten += query_escape(easy.get(), REDACTION_MASK);
        } else if (eq != std::string::npos) {
            std::string value = query_unescape(easy.get(), pair.substr(eq + 1));
            rewritten += "=";
            rewritten += query_escape(easy.get(), truncate_preview(value));
        }
    }

    std::string safe_url = raw_url.substr(0, query_pos + 1);
    safe_url += rewritten;
    safe_url += raw_url.substr(query_end);

    report("url", RedactionStatus::sanitized, FallbackReason::none);
    return Result::sanitized(safe_url);
}

std::string Redactor::redact_json_bytes(const std::string& body) const {
    return redact_json_bytes_checked(body).value;
}

RedactionResult<std::string> Redactor::redact_json_bytes_checked(const std::string& body) const {
    using Result = RedactionResult<std::string>;

    if (json_nesting_depth(body) > MAX_JSON_DEPTH) {
        report("json", RedactionStatus::unchanged, FallbackReason::malformed_json);
        return Result::unchanged(body, FallbackReason::malformed_json,
                                 "nesting depth exceeds " + std::to_string(MAX_JSON_DEPTH));
    }

    json parsed;
    try {
        parsed = json::parse(replace_invalid_utf8(body));
    } catch (const json::parse_error& e) {
        // e.what() quotes the offending input; keep only the position
        report("json", RedactionStatus::unchanged, FallbackReason::malformed_json);
        return Result::unchanged(body, FallbackReason::malformed_json,
                                 "parse_error." + std::to_string(e.id) +
                                 " at byte " + std::to_string(e.byte));
    }

    json redacted = redact_json_node(parsed);

    std::string serialized;
    try {
        serialized = redacted.dump();
    } catch (const json::type_error& e) {
        report("json", RedactionStatus::unchanged, FallbackReason::serialization_failed);
        return Result::unchanged(body, FallbackReason::serialization_failed,
                                 "type_error." + std::to_string(e.id));
    }

    report("json", RedactionStatus::sanitized, FallbackReason::none);
    return Result::sanitized(std::move(serialized));
}

json Redactor::redact_json_node(const json& node) const {
    if (node.is_object()) {
        json out = json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (is_sensitive_key(it.key())) {
                out[it.key()] = REDACTION_MASK;
                continue;
            }
            out[it.key()] = redact_json_node(it.value());
        }
        return out;
    }
    if (node.is_array()) {
        json out = json::array();
        for (const auto& item : node) {
            out.push_back(redact_json_node(item));
        }
        return out;
    }
    if (node.is_string()) {
        return truncate_preview(node.get_ref<const std::string&>());
    }
    return node;
}

std::string Redactor::redact_pem(const std::string& text) const {
    static const std::string begin_marker = "-----BEGIN ";
    static const std::string end_marker = "-----END ";

    std::string out;
    out.reserve(text.size());

    size_t copied = 0;
    size_t search = 0;
    while (true) {
        size_t begin = text.find(begin_marker, search);
        if (begin == std::string::npos) {
            break;
        }

        size_t body = armor_label_end(text, begin + begin_marker.size());
        if (body == std::string::npos) {
            search = begin + 1;
            continue;
        }

        // Shortest block: first END armor after a non-empty body
        size_t block_end = std::string::npos;
        size_t end = text.find(end_marker, body + 1);
        while (end != std::string::npos) {
            block_end = armor_label_end(text, end + end_marker.size());
            if (block_end != std::string::npos) {
                break;
            }
            end = text.find(end_marker, end + 1);
        }

        // Later BEGIN markers only see a subset of these END candidates
        if (block_end == std::string::npos) {
            break;
        }

        out.append(text, copied, begin - copied);
        out += REDACTION_MASK;
        copied = block_end;
        search = block_end;
    }

    out.append(text, copied, std::string::npos);
    report("pem", RedactionStatus::sanitized, FallbackReason::none);
    return out;
}

} // namespace redaction
} // namespace confvault
