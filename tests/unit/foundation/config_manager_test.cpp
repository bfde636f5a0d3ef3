#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "bulwark/foundation/config_manager.hpp"

using namespace bulwark::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// ConfigManager: YAML loading and typed access
// ---------------------------------------------------------------------------

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("bulwark_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
circuit_breaker:
  failure_threshold: 5
  name: "payments"
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto threshold = config.get<int>("circuit_breaker.failure_threshold");
    ASSERT_TRUE(threshold.hasValue());
    EXPECT_EQ(threshold.value(), 5);

    auto name = config.get<std::string>("circuit_breaker.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "payments");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("bad.yaml", "key: [unterminated");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1").hasValue());
    ASSERT_TRUE(config.loadString("b: 2").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("manager.monitor_interval", 9090);

    auto result = config.get<int>("manager.monitor_interval");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9090);
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("key: value").hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("rate_limiter.rps", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<int>("rate_limiter.rps", 50);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "rate_limiter.rps");
}

TEST_F(ConfigManagerTest, SequencesAreStoredWhole) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("retry_on_status: [429, 503]").hasValue());

    auto statuses = config.get<std::vector<int>>("retry_on_status");
    ASSERT_TRUE(statuses.hasValue());
    EXPECT_EQ(statuses.value(), (std::vector<int>{429, 503}));
}

TEST_F(ConfigManagerTest, ChildKeysListsDirectChildren) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
http_client:
  default_headers:
    Accept: application/json
    X-Team: core
  tls:
    ca: /etc/ca.pem
)").hasValue());

    EXPECT_EQ(config.childKeys("http_client.default_headers"),
              (std::vector<std::string>{"Accept", "X-Team"}));
    EXPECT_EQ(config.childKeys("http_client"),
              (std::vector<std::string>{"default_headers", "tls"}));
    EXPECT_TRUE(config.childKeys("missing").empty());
}

// ---------------------------------------------------------------------------
// Durations
// ---------------------------------------------------------------------------

TEST(ParseDurationTest, AcceptsUnits) {
    EXPECT_EQ(parseDuration("250ms").value(), 250ms);
    EXPECT_EQ(parseDuration("5s").value(), 5000ms);
    EXPECT_EQ(parseDuration("1.5s").value(), 1500ms);
    EXPECT_EQ(parseDuration("2m").value(), 120000ms);
    EXPECT_EQ(parseDuration("1h").value(), 3600000ms);
    EXPECT_EQ(parseDuration(" 100 ").value(), 100ms);
}

TEST(ParseDurationTest, RejectsMalformedInput) {
    EXPECT_TRUE(parseDuration("").hasError());
    EXPECT_TRUE(parseDuration("5 days").hasError());
    EXPECT_TRUE(parseDuration("fast").hasError());
    EXPECT_TRUE(parseDuration("-5s").hasError());
    EXPECT_EQ(parseDuration("10d").error().code(), ErrorCode::InvalidArgument);
}

TEST_F(ConfigManagerTest, GetDurationReadsIntegersAsMilliseconds) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("open_timeout: 30000\nhalf_open: 10s").hasValue());

    EXPECT_EQ(config.getDuration("open_timeout").value(), 30000ms);
    EXPECT_EQ(config.getDuration("half_open").value(), 10000ms);
}

TEST_F(ConfigManagerTest, GetDurationReportsTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("open_timeout: soon").hasValue());

    auto result = config.getDuration("open_timeout");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(config.getDuration("absent").error().code(), ErrorCode::ConfigKeyNotFound);
}
