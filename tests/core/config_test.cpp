#include "chunkgate/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using chunkgate::TransferConfig;
using chunkgate::load_config;
using chunkgate::parse_config;
using chunkgate::parse_log_level;

namespace {

fs::path write_temp_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    auto path = fs::temp_directory_path() /
                ("chunkgate_config_test_" + std::to_string(counter.fetch_add(1)) + ".json");
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto config = parse_config("{}");
    ASSERT_TRUE(config.is_ok());

    const TransferConfig defaults;
    EXPECT_EQ(config.value().chunk_size, defaults.chunk_size);
    EXPECT_EQ(config.value().chunk_size, 16384u);
    EXPECT_EQ(config.value().max_failures, 3u);
    EXPECT_EQ(config.value().output_dir, fs::path("received"));
    EXPECT_EQ(config.value().log_level, "info");
}

TEST(ConfigTest, ReadsAllKeys) {
    auto config = parse_config(R"({
        "chunk_size": 65536,
        "max_failures": 5,
        "worker_threads": 8,
        "output_dir": "/tmp/out",
        "log_level": "debug",
        "history_size": 10
    })");
    ASSERT_TRUE(config.is_ok());

    EXPECT_EQ(config.value().chunk_size, 65536u);
    EXPECT_EQ(config.value().max_failures, 5u);
    EXPECT_EQ(config.value().worker_threads, 8u);
    EXPECT_EQ(config.value().output_dir, fs::path("/tmp/out"));
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().history_size, 10u);
}

TEST(ConfigTest, RejectsInvalidJson) {
    auto config = parse_config("{ chunk_size: ");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "Config is not valid JSON");
}

TEST(ConfigTest, RejectsNonObjectRoot) {
    EXPECT_TRUE(parse_config("[1, 2, 3]").is_error());
}

TEST(ConfigTest, RejectsWrongValueType) {
    EXPECT_TRUE(parse_config(R"({"chunk_size": "big"})").is_error());
}

TEST(ConfigTest, RejectsZeroLimits) {
    EXPECT_TRUE(parse_config(R"({"chunk_size": 0})").is_error());
    EXPECT_TRUE(parse_config(R"({"max_failures": 0})").is_error());
    EXPECT_TRUE(parse_config(R"({"worker_threads": 0})").is_error());
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    auto config = parse_config(R"({"log_level": "chatty"})");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "Unknown log level: chatty");
}

TEST(ConfigTest, LoadsFromFile) {
    const auto path = write_temp_config(R"({"chunk_size": 1024})");

    auto config = load_config(path);
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().chunk_size, 1024u);
}

TEST(ConfigTest, MissingFileIsAnError) {
    EXPECT_TRUE(load_config("/nonexistent/chunkgate.json").is_error());
}

TEST(ConfigTest, ParsesLogLevels) {
    ASSERT_TRUE(parse_log_level("warn").is_ok());
    EXPECT_EQ(parse_log_level("warn").value(), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off").value(), spdlog::level::off);
    EXPECT_TRUE(parse_log_level("loud").is_error());
}

TEST(ConfigTest, RejectsNegativeLimits) {
    auto chunk = parse_config(R"({"chunk_size": -1})");
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error(), "chunk_size must be a positive integer");

    EXPECT_TRUE(parse_config(R"({"max_failures": -1})").is_error());
    EXPECT_TRUE(parse_config(R"({"worker_threads": -4})").is_error());
    EXPECT_TRUE(parse_config(R"({"history_size": -5})").is_error());
}

TEST(ConfigTest, RejectsNonIntegerLimits) {
    EXPECT_TRUE(parse_config(R"({"chunk_size": 1.5})").is_error());
    EXPECT_TRUE(parse_config(R"({"max_failures": 3.0})").is_error());
    EXPECT_TRUE(parse_config(R"({"worker_threads": true})").is_error());
    EXPECT_TRUE(parse_config(R"({"history_size": null})").is_error());
}

TEST(ConfigTest, ZeroLimitMessageNamesTheKey) {
    auto config = parse_config(R"({"max_failures": 0})");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error(), "max_failures must be > 0");
}

TEST(ConfigTest, AcceptsLargeChunkSize) {
    auto config = parse_config(R"({"chunk_size": 18446744073709551615})");
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().chunk_size, UINT64_MAX);
}
