/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace buffered_statsd;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "bs_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.buffer.flush_interval_ms, 1000u);
    EXPECT_EQ(config.buffer.queue_capacity, 100u);
    EXPECT_EQ(config.buffer.close_timeout_ms, 0u);
    EXPECT_EQ(config.statsd.host, "127.0.0.1");
    EXPECT_EQ(config.statsd.port, 8125);
    EXPECT_TRUE(config.telemetry.log_dir.empty());
    EXPECT_TRUE(validate_config(config));
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [buffer]
        flush_interval_ms = 250
        queue_capacity = 4096
        send_workers = 8
        close_timeout_ms = 2000

        [statsd]
        host = "10.0.0.5"
        port = 9125
        prefix = "api."
        max_packet_size = 512

        [telemetry]
        log_dir = "/tmp/bs_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.buffer.flush_interval_ms, 250u);
    EXPECT_EQ(config.buffer.flush_interval(), std::chrono::milliseconds(250));
    EXPECT_EQ(config.buffer.queue_capacity, 4096u);
    EXPECT_EQ(config.buffer.send_workers, 8u);
    EXPECT_EQ(config.buffer.close_timeout_ms, 2000u);
    EXPECT_EQ(config.statsd.host, "10.0.0.5");
    EXPECT_EQ(config.statsd.port, 9125);
    EXPECT_EQ(config.statsd.prefix, "api.");
    EXPECT_EQ(config.statsd.max_packet_size, 512u);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/bs_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [statsd]
        prefix = "worker."
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->statsd.prefix, "worker.");
    // Defaults for everything else
    EXPECT_EQ(result->statsd.port, 8125);
    EXPECT_EQ(result->buffer.flush_interval_ms, 1000u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, ZeroIntervalRejected) {
    auto path = write_toml(R"(
        [buffer]
        flush_interval_ms = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("flush_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRanges) {
    auto config = default_config();
    config.buffer.queue_capacity = 0;
    EXPECT_FALSE(validate_config(config));

    config = default_config();
    config.statsd.port = 0;
    EXPECT_FALSE(validate_config(config));

    config = default_config();
    config.statsd.max_packet_size = 16;
    EXPECT_FALSE(validate_config(config));

    config = default_config();
    config.statsd.max_packet_size = 70000;
    EXPECT_FALSE(validate_config(config));

    config = default_config();
    config.telemetry.log_level = "verbose";
    auto result = validate_config(config);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, NegativeOrOversizedIntegersRejected) {
    for (const char* content : {
             "[buffer]\nflush_interval_ms = -1\n",
             "[buffer]\nqueue_capacity = 4294967296\n",
             "[statsd]\nport = 70000\n",
             "[statsd]\nport = -8125\n",
             "[telemetry]\nrotate_count = -5\n"}) {
        auto result = load_config(write_toml(content));
        ASSERT_FALSE(result.has_value()) << content;
        EXPECT_EQ(result.error().code, ErrorCode::Config) << content;
        EXPECT_NE(result.error().message.find("out of range"), std::string::npos) << content;
    }
}

TEST_F(ConfigTest, LargestValuesAccepted) {
    auto path = write_toml(R"(
        [buffer]
        close_timeout_ms = 4294967295

        [statsd]
        port = 65535
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->buffer.close_timeout_ms, 4294967295u);
    EXPECT_EQ(result->statsd.port, 65535);
}

TEST_F(ConfigTest, NonIntegerValueRejected) {
    auto path = write_toml(R"(
        [statsd]
        port = "8125"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("statsd.port"), std::string::npos);
}

// ═══════════════════════════════════════════════
// Command-line Overrides
// ═══════════════════════════════════════════════

TEST(ParseUnsignedTest, AcceptsValuesWithinLimit) {
    auto port = parse_unsigned("8125", 65535);
    ASSERT_TRUE(port);
    EXPECT_EQ(*port, 8125u);

    auto edge = parse_unsigned("65535", 65535);
    ASSERT_TRUE(edge);
    EXPECT_EQ(*edge, 65535u);

    auto zero = parse_unsigned("0", 65535);
    ASSERT_TRUE(zero);
    EXPECT_EQ(*zero, 0u);
}

TEST(ParseUnsignedTest, RejectsOutOfRangeInsteadOfWrapping) {
    for (const char* text : {"70000", "65536", "99999999999999999999999"}) {
        auto result = parse_unsigned(text, 65535);
        ASSERT_FALSE(result) << text;
        EXPECT_EQ(result.error().code, ErrorCode::Config) << text;
        EXPECT_NE(result.error().message.find("out of range"), std::string::npos) << text;
    }
}

TEST(ParseUnsignedTest, RejectsMalformedText) {
    for (const char* text : {"", "-1", "+5", "abc", "12ms", " 12"}) {
        auto result = parse_unsigned(text, 4294967295u);
        ASSERT_FALSE(result) << '"' << text << '"';
        EXPECT_EQ(result.error().code, ErrorCode::Config);
    }
}
