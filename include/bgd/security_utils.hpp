#pragma once

#include "bgd/error_handling.hpp"
#include <string>
#include <string_view>
#include <unordered_set>

namespace bgd {

class SecurityUtils {
public:
    // Log input sanitization (CWE-117)
    static std::string sanitize_log_input(std::string_view input);

    // Whitelist validation for values substituted into platform commands
    static bool is_valid_image_tag(std::string_view tag);
    static bool is_valid_environment_name(std::string_view name);
    static bool is_valid_hostname(std::string_view host);
    static bool is_safe_string(std::string_view input);

    // Digests and signatures for the audit record (OpenSSL)
    static Result<std::string> sha256_hex(std::string_view data);
    static Result<std::string> hmac_sha256_hex(std::string_view key, std::string_view data);

    // Cryptographically random hex string of 2 * bytes characters
    static Result<std::string> random_hex(size_t bytes);

private:
    static const std::unordered_set<char> CONTROL_CHARS;
};

} // namespace bgd
