/**
 * @file security_utils.cpp
 * @brief Input validation and audit-record cryptography
 *
 * Provides:
 * - Log injection prevention (CWE-117)
 * - Whitelist validation of values that end up in platform commands
 * - SHA-256 digests and HMAC-SHA256 signatures for deployment reports
 * - Random deployment identifiers
 *
 * Security principles:
 * - Fail-safe defaults (reject on doubt)
 * - Input validation (whitelist approach)
 * - Output encoding (escape special chars)
 */

#include "bgd/security_utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace bgd {

// Control characters to filter (security: prevent injection)
const std::unordered_set<char> SecurityUtils::CONTROL_CHARS = {
    '\x00', '\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07',
    '\x08', '\x0B', '\x0C', '\x0E', '\x0F', '\x10', '\x11', '\x12',
    '\x13', '\x14', '\x15', '\x16', '\x17', '\x18', '\x19', '\x1A',
    '\x1B', '\x1C', '\x1D', '\x1E', '\x1F', '\x7F'
};

namespace {

std::string to_hex(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

/**
 * @brief Sanitize input for logging (prevent log injection)
 * @param input Raw input string
 * @return Sanitized string safe for logging
 *
 * Command output and probe details are logged verbatim elsewhere in the
 * release flow, so every log line goes through here:
 * - Removes control characters
 * - Escapes newlines, carriage returns, tabs
 * - Escapes backslashes and quotes
 */
std::string SecurityUtils::sanitize_log_input(std::string_view input) {
    std::string sanitized;
    sanitized.reserve(input.size() * 2);

    for (char c : input) {
        switch (c) {
            case '\n': sanitized += "\\n"; continue;
            case '\r': sanitized += "\\r"; continue;
            case '\t': sanitized += "\\t"; continue;
            case '\\': sanitized += "\\\\"; continue;
            case '"':  sanitized += "\\\""; continue;
            default: break;
        }

        if (CONTROL_CHARS.contains(c)) {
            continue;
        }
        sanitized += c;
    }

    return sanitized;
}

/**
 * @brief Validate a container image tag
 *
 * Same grammar as a registry tag: first character alphanumeric or '_',
 * then up to 127 of [A-Za-z0-9_.-].
 */
bool SecurityUtils::is_valid_image_tag(std::string_view tag) {
    if (tag.empty() || tag.size() > 128) return false;

    auto first = static_cast<unsigned char>(tag.front());
    if (!std::isalnum(first) && tag.front() != '_') return false;

    return std::all_of(tag.begin(), tag.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
    });
}

/**
 * @brief Validate an environment name
 *
 * Environment names become namespace and release names, so they follow the
 * DNS label rules: lowercase alphanumerics and '-', at most 63 characters,
 * no leading or trailing '-'.
 */
bool SecurityUtils::is_valid_environment_name(std::string_view name) {
    if (name.empty() || name.size() > 63) return false;
    if (name.front() == '-' || name.back() == '-') return false;

    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

// RFC 1123 host: dot-separated labels of [a-z0-9-], no leading or trailing hyphen
bool SecurityUtils::is_valid_hostname(std::string_view host) {
    if (host.empty() || host.size() > 253) return false;

    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        if (dot == std::string_view::npos) dot = host.size();
        auto label = host.substr(start, dot - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        bool ok = std::all_of(label.begin(), label.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '-';
        });
        if (!ok) return false;
        start = dot + 1;
    }
    return true;
}

bool SecurityUtils::is_safe_string(std::string_view input) {
    return std::none_of(input.begin(), input.end(),
                        [](char c) { return CONTROL_CHARS.contains(c); });
}

Result<std::string> SecurityUtils::sha256_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return Result<std::string>(ErrorCode::CRYPTO_FAILED, "EVP_Digest(sha256)");
    }

    return to_hex(digest, digest_len);
}

Result<std::string> SecurityUtils::hmac_sha256_hex(std::string_view key, std::string_view data) {
    if (key.empty()) {
        return Result<std::string>(ErrorCode::CRYPTO_FAILED, "empty HMAC key");
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             mac, &mac_len) == nullptr) {
        return Result<std::string>(ErrorCode::CRYPTO_FAILED, "HMAC(sha256)");
    }

    return to_hex(mac, mac_len);
}

Result<std::string> SecurityUtils::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        return Result<std::string>(ErrorCode::CRYPTO_FAILED, "RAND_bytes");
    }
    return to_hex(buffer.data(), buffer.size());
}

} // namespace bgd
