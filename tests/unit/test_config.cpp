/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace exec_engine;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ee_test_config";
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
    EXPECT_EQ(config.engine.worker_count, 0u);
    EXPECT_EQ(config.engine.default_timeout_ms, 10000u);
    EXPECT_EQ(config.engine.grace_period_ms, 1000u);
    EXPECT_EQ(config.monitor.sampling_interval_ms, 100u);
    EXPECT_EQ(config.storage.retry_attempts, 5u);
    ASSERT_EQ(config.languages.size(), 3u);
    EXPECT_EQ(config.languages.at(Language::Python).interpreter, "python3");
    EXPECT_EQ(config.languages.at(Language::Python).entry_file, "main.py");
    EXPECT_EQ(config.languages.at(Language::JavaScript).entry_file, "index.js");
    EXPECT_EQ(config.languages.at(Language::Ruby).entry_file, "main.rb");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [engine]
        worker_count = 4
        default_timeout_ms = 2500
        grace_period_ms = 300

        [runner]
        output_limit_bytes = 4096
        poll_interval_ms = 10

        [monitor]
        sampling_interval_ms = 250

        [sandbox]
        root_dir = "/tmp/ee_sandboxes"
        max_sandboxes = 8
        disk_quota_mb = 16
        inode_quota = 100
        max_processes = 32
        memory_limit_mb = 512
        isolate_namespaces = false

        [storage]
        retry_attempts = 2
        retry_backoff_ms = 5

        [languages.python]
        interpreter = "/usr/bin/python3"
        args = ["-u", "-B"]
        env = ["PYTHONHASHSEED=0"]

        [telemetry]
        log_dir = "/tmp/ee_logs"
        rotate_count = 2
        log_level = "debug"
        metrics_enabled = false
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.engine.worker_count, 4u);
    EXPECT_EQ(config.engine.default_timeout_ms, 2500u);
    EXPECT_EQ(config.engine.grace_period_ms, 300u);
    EXPECT_EQ(config.runner.output_limit_bytes, 4096u);
    EXPECT_EQ(config.runner.poll_interval_ms, 10u);
    EXPECT_EQ(config.monitor.sampling_interval_ms, 250u);
    EXPECT_EQ(config.sandbox.root_dir, std::filesystem::path{"/tmp/ee_sandboxes"});
    EXPECT_EQ(config.sandbox.max_sandboxes, 8u);
    EXPECT_EQ(config.sandbox.disk_quota_mb, 16u);
    EXPECT_EQ(config.sandbox.inode_quota, 100u);
    EXPECT_EQ(config.sandbox.max_processes, 32u);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 512u);
    EXPECT_FALSE(config.sandbox.isolate_namespaces);
    EXPECT_EQ(config.storage.retry_attempts, 2u);
    EXPECT_EQ(config.storage.retry_backoff_ms, 5u);

    const auto& python = config.languages.at(Language::Python);
    EXPECT_EQ(python.interpreter, "/usr/bin/python3");
    EXPECT_EQ(python.args, (std::vector<std::string>{"-u", "-B"}));
    EXPECT_EQ(python.env, (std::vector<std::string>{"PYTHONHASHSEED=0"}));
    EXPECT_EQ(python.entry_file, "main.py");

    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/ee_logs"});
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_FALSE(config.telemetry.metrics_enabled);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [engine]
        default_timeout_ms = 500
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->engine.default_timeout_ms, 500u);
    // Defaults for everything else
    EXPECT_EQ(result->engine.grace_period_ms, 1000u);
    EXPECT_EQ(result->sandbox.max_sandboxes, 64u);
    EXPECT_EQ(result->languages.size(), 3u);
}

TEST_F(ConfigTest, UnknownLanguageSection) {
    auto path = write_toml(R"(
        [languages.cobol]
        interpreter = "cobc"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, DefaultDependencyAndMemorySettings) {
    auto config = default_config();
    EXPECT_EQ(config.sandbox.memory_limit_mb, 512u);
    EXPECT_EQ(config.runner.install_timeout_ms, 300000u);

    const auto& python = config.languages.at(Language::Python);
    EXPECT_EQ(python.manifest, "requirements.txt");
    ASSERT_FALSE(python.install.empty());
    EXPECT_EQ(python.install.front(), "python3");
    EXPECT_FALSE(python.memory_limit_mb.has_value());

    const auto& javascript = config.languages.at(Language::JavaScript);
    EXPECT_EQ(javascript.manifest, "package.json");
    EXPECT_EQ(javascript.memory_limit_mb, std::optional<uint64_t>{0});

    EXPECT_EQ(config.languages.at(Language::Ruby).manifest, "Gemfile");
}

TEST_F(ConfigTest, LanguageInstallSettings) {
    auto path = write_toml(R"(
        [languages.ruby]
        manifest = "gems.rb"
        install = ["bundle", "install", "--local"]
        memory_limit_mb = 1024
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& ruby = result->languages.at(Language::Ruby);
    EXPECT_EQ(ruby.manifest, "gems.rb");
    EXPECT_EQ(ruby.install, (std::vector<std::string>{"bundle", "install", "--local"}));
    EXPECT_EQ(ruby.memory_limit_mb, std::optional<uint64_t>{1024});
    EXPECT_EQ(ruby.entry_file, "main.rb");
}

TEST_F(ConfigTest, NegativeCountRejected) {
    auto path = write_toml(R"(
        [engine]
        worker_count = -1
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
    EXPECT_NE(result.error().message.find("engine.worker_count"), std::string::npos);
}

TEST_F(ConfigTest, NegativeLanguageMemoryLimitRejected) {
    auto path = write_toml(R"(
        [languages.python]
        memory_limit_mb = -5
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}
