#include <gtest/gtest.h>
#include "bgd/security_utils.hpp"

using namespace bgd;

class SecurityUtilsTest : public ::testing::Test {};

TEST_F(SecurityUtilsTest, LogInputSanitization) {
    std::string malicious = "deploy ok\n[2024-01-01 00:00:00.000] INFO  forged line";
    auto sanitized = SecurityUtils::sanitize_log_input(malicious);

    EXPECT_EQ(sanitized.find('\n'), std::string::npos);
    EXPECT_NE(sanitized.find("\\n"), std::string::npos);

    std::string control = std::string("a\x1b[31mb") + '\0' + "c";
    auto stripped = SecurityUtils::sanitize_log_input(control);
    EXPECT_EQ(stripped.find('\x1b'), std::string::npos);
    EXPECT_EQ(stripped.find('\0'), std::string::npos);
}

TEST_F(SecurityUtilsTest, ImageTagValidation) {
    EXPECT_TRUE(SecurityUtils::is_valid_image_tag("latest"));
    EXPECT_TRUE(SecurityUtils::is_valid_image_tag("v1.2.3"));
    EXPECT_TRUE(SecurityUtils::is_valid_image_tag("sha-1a2b3c_rc.1"));

    EXPECT_FALSE(SecurityUtils::is_valid_image_tag(""));
    EXPECT_FALSE(SecurityUtils::is_valid_image_tag("-v1"));
    EXPECT_FALSE(SecurityUtils::is_valid_image_tag(".hidden"));
    EXPECT_FALSE(SecurityUtils::is_valid_image_tag("v1;rm -rf /"));
    EXPECT_FALSE(SecurityUtils::is_valid_image_tag("v1 --set x=y"));
    EXPECT_FALSE(SecurityUtils::is_valid_image_tag(std::string(129, 'a')));
    EXPECT_TRUE(SecurityUtils::is_valid_image_tag(std::string(128, 'a')));
}

TEST_F(SecurityUtilsTest, EnvironmentNameValidation) {
    EXPECT_TRUE(SecurityUtils::is_valid_environment_name("blue"));
    EXPECT_TRUE(SecurityUtils::is_valid_environment_name("green-2"));

    EXPECT_FALSE(SecurityUtils::is_valid_environment_name(""));
    EXPECT_FALSE(SecurityUtils::is_valid_environment_name("Blue"));
    EXPECT_FALSE(SecurityUtils::is_valid_environment_name("-blue"));
    EXPECT_FALSE(SecurityUtils::is_valid_environment_name("blue-"));
    EXPECT_FALSE(SecurityUtils::is_valid_environment_name("../etc"));
    EXPECT_FALSE(SecurityUtils::is_valid_environment_name(std::string(64, 'a')));
}

TEST_F(SecurityUtilsTest, HostnameValidation) {
    EXPECT_TRUE(SecurityUtils::is_valid_hostname("api.example.com"));
    EXPECT_TRUE(SecurityUtils::is_valid_hostname("localhost"));
    EXPECT_TRUE(SecurityUtils::is_valid_hostname("edge-01.Example.org"));

    EXPECT_FALSE(SecurityUtils::is_valid_hostname(""));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname("api..example.com"));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname("api.example.com."));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname("-api.example.com"));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname("api\",\"x"));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname("api example.com"));
    EXPECT_FALSE(SecurityUtils::is_valid_hostname(std::string(64, 'a') + ".com"));
}

TEST_F(SecurityUtilsTest, Sha256KnownVector) {
    auto digest = SecurityUtils::sha256_hex("abc");
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(SecurityUtilsTest, HmacSha256KnownVector) {
    // RFC 4231 test case 2
    auto mac = SecurityUtils::hmac_sha256_hex("Jefe", "what do ya want for nothing?");
    ASSERT_TRUE(mac.has_value());
    EXPECT_EQ(mac.value(), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(SecurityUtilsTest, HmacRejectsEmptyKey) {
    auto mac = SecurityUtils::hmac_sha256_hex("", "payload");
    ASSERT_TRUE(mac.has_error());
    EXPECT_EQ(to_error_code(mac.error()), ErrorCode::CRYPTO_FAILED);
}

TEST_F(SecurityUtilsTest, RandomHexLengthAndUniqueness) {
    auto first = SecurityUtils::random_hex(8);
    auto second = SecurityUtils::random_hex(8);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value().size(), 16u);
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(first.value().find_first_not_of("0123456789abcdef"), std::string::npos);
}
