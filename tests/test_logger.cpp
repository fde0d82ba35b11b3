#include <gtest/gtest.h>
#include "bgd/logger.hpp"
#include "test_doubles.hpp"
#include <fstream>
#include <sstream>

using namespace bgd;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        logger.enable_console(false);
        logger.set_level(LogLevel::DEBUG);
        logger.enable_structured(false);
        logger.set_rate_limit(std::chrono::milliseconds(0));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        ASSERT_TRUE(logger.set_output_file("").has_value());
        logger.set_level(LogLevel::INFO);
        logger.enable_structured(false);
        logger.enable_console(true);
    }

    static std::string read_file(const std::string& path) {
        std::ifstream file(path);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    test::TempDir dir;
};

TEST_F(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("WARN", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::WARN);
}

TEST_F(LoggerTest, PlainFormat) {
    auto line = Logger::instance().format_message(LogLevel::ERROR, "switch failed");
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("] ERROR switch failed"), std::string::npos);
}

TEST_F(LoggerTest, StructuredFormat) {
    Logger::instance().enable_structured(true);
    auto line = Logger::instance().format_message(LogLevel::INFO, "deployed");
    EXPECT_EQ(line.front(), '{');
    EXPECT_NE(line.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(line.find("\"message\":\"deployed\""), std::string::npos);
}

TEST_F(LoggerTest, TeesIntoFileAndRespectsLevel) {
    auto& logger = Logger::instance();
    std::string path = dir.file("audit.log");
    ASSERT_TRUE(logger.set_output_file(path).has_value());
    EXPECT_EQ(logger.output_file(), path);

    logger.set_level(LogLevel::WARN);
    LOG_INFO("hidden message");
    LOG_WARN("visible message");

    auto content = read_file(path);
    EXPECT_EQ(content.find("hidden message"), std::string::npos);
    EXPECT_NE(content.find("visible message"), std::string::npos);
}

TEST_F(LoggerTest, MessagesAreSanitized) {
    auto& logger = Logger::instance();
    std::string path = dir.file("sanitized.log");
    ASSERT_TRUE(logger.set_output_file(path).has_value());

    LOG_INFO("line one\nINFO forged");

    auto content = read_file(path);
    EXPECT_NE(content.find("line one\\nINFO forged"), std::string::npos);
}

TEST_F(LoggerTest, RateLimitNeverDropsErrors) {
    auto& logger = Logger::instance();
    std::string path = dir.file("limited.log");
    ASSERT_TRUE(logger.set_output_file(path).has_value());
    logger.set_rate_limit(std::chrono::milliseconds(60000));

    LOG_INFO("first info");
    LOG_INFO("second info");
    LOG_ERROR("first error");
    LOG_ERROR("second error");

    auto content = read_file(path);
    EXPECT_EQ(content.find("second info"), std::string::npos);
    EXPECT_NE(content.find("first error"), std::string::npos);
    EXPECT_NE(content.find("second error"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableFileIsReported) {
    auto result = Logger::instance().set_output_file(dir.file("missing/dir/log"));
    EXPECT_TRUE(result.has_error());
    EXPECT_TRUE(Logger::instance().output_file().empty());
}
