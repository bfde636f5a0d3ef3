/// @file json_log_formatter_test.cpp
/// @brief Unit tests for JsonLogFormatter and correlation scopes.

#include <gtest/gtest.h>

#include <atomic>
#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "bulwark/foundation/json_log_formatter.hpp"

#include "support/mock_logger.hpp"

using namespace bulwark::foundation;
using bulwark::testing::LoggingTest;

// ===========================================================================
// JsonLogFormatter Tests
// ===========================================================================

TEST(JsonLogFormatterTest, ProducesValidJsonStructure) {
    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "Manager starting");

    ASSERT_FALSE(json.empty());
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');

    EXPECT_NE(json.find("\"timestamp\""), std::string::npos);
    EXPECT_NE(json.find("\"level\""), std::string::npos);
    EXPECT_NE(json.find("\"category\""), std::string::npos);
    EXPECT_NE(json.find("\"message\""), std::string::npos);
}

TEST(JsonLogFormatterTest, ContainsCorrectLevelAndCategory) {
    auto json = JsonLogFormatter::format(
        LogLevel::Error, LogCategory::Http, "Connection lost");

    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"Http\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Connection lost\""), std::string::npos);
}

TEST(JsonLogFormatterTest, AllLogLevelsFormatCorrectly) {
    struct TestCase {
        LogLevel level;
        const char* expected;
    };
    TestCase cases[] = {
        {LogLevel::Trace,    "\"level\":\"TRACE\""},
        {LogLevel::Debug,    "\"level\":\"DEBUG\""},
        {LogLevel::Info,     "\"level\":\"INFO\""},
        {LogLevel::Warning,  "\"level\":\"WARNING\""},
        {LogLevel::Error,    "\"level\":\"ERROR\""},
        {LogLevel::Critical, "\"level\":\"CRITICAL\""},
    };

    for (const auto& tc : cases) {
        auto json = JsonLogFormatter::format(tc.level, LogCategory::Core, "test");
        EXPECT_NE(json.find(tc.expected), std::string::npos)
            << "Expected " << tc.expected << " in: " << json;
    }
}

TEST(JsonLogFormatterTest, TimestampIsIso8601) {
    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "test");

    std::regex isoPattern(
        R"RE("timestamp":"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")RE");
    EXPECT_TRUE(std::regex_search(json, isoPattern))
        << "Timestamp not in ISO 8601 format: " << json;
}

TEST(JsonLogFormatterTest, IncludesContextFields) {
    LogContext ctx;
    ctx.with("circuit", "payments").with("failure_count", "3");

    auto json = JsonLogFormatter::format(
        LogLevel::Warning, LogCategory::Breaker, "Circuit breaker opened", ctx);

    EXPECT_NE(json.find("\"fields\":{"), std::string::npos);
    EXPECT_NE(json.find("\"circuit\":\"payments\""), std::string::npos);
    EXPECT_NE(json.find("\"failure_count\":\"3\""), std::string::npos);
}

TEST(JsonLogFormatterTest, OmitsEmptyContextFields) {
    LogContext ctx;

    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "No context", ctx);

    EXPECT_EQ(json.find("\"fields\""), std::string::npos);
    EXPECT_EQ(json.find("\"correlation_id\""), std::string::npos);
}

TEST(JsonLogFormatterTest, IncludesExplicitCorrelationId) {
    LogContext ctx;
    ctx.correlationId = "req-abc-123";

    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Http, "test", ctx);

    EXPECT_NE(json.find("\"correlation_id\":\"req-abc-123\""), std::string::npos);
}

TEST(JsonLogFormatterTest, EscapesSpecialCharacters) {
    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core,
        "message with \"quotes\" and \\backslash and\nnewline");

    EXPECT_NE(json.find("\\\"quotes\\\""), std::string::npos);
    EXPECT_NE(json.find("\\\\backslash"), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
}

TEST(JsonLogFormatterTest, EscapesControlCharactersAsUnicode) {
    std::string out;
    appendJsonString(out, std::string("a\x01z"));
    EXPECT_EQ(out, "\"a\\u0001z\"");
}

TEST(JsonLogFormatterTest, SingleLineOutput) {
    LogContext ctx;
    ctx.with("key", "multi\nline");

    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "test", ctx);

    EXPECT_EQ(json.find('\n'), std::string::npos);
}

// ===========================================================================
// UUID Generation Tests
// ===========================================================================

TEST(UuidV4Test, GeneratesUuidV4Format) {
    auto id = generateUuidV4();

    // xxxxxxxx-xxxx-4xxx-[89ab]xxx-xxxxxxxxxxxx
    std::regex uuidPattern(
        R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");
    EXPECT_TRUE(std::regex_match(id, uuidPattern))
        << "Invalid UUID v4 format: " << id;
}

TEST(UuidV4Test, GeneratesUniqueIds) {
    constexpr int kCount = 1000;
    std::set<std::string> ids;

    for (int i = 0; i < kCount; ++i) {
        ids.insert(generateUuidV4());
    }

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kCount));
}

TEST(UuidV4Test, ThreadSafeGeneration) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;

    std::vector<std::vector<std::string>> results(kThreads);
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&results, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[static_cast<std::size_t>(t)].push_back(generateUuidV4());
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    std::set<std::string> allIds;
    for (const auto& threadIds : results) {
        allIds.insert(threadIds.begin(), threadIds.end());
    }
    EXPECT_EQ(allIds.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// ===========================================================================
// CorrelationScope Tests
// ===========================================================================

TEST(CorrelationScopeTest, SetsAndRestoresCorrelationId) {
    EXPECT_TRUE(CorrelationScope::current().empty());

    {
        CorrelationScope scope("req-001");
        EXPECT_EQ(CorrelationScope::current(), "req-001");
    }

    EXPECT_TRUE(CorrelationScope::current().empty());
}

TEST(CorrelationScopeTest, NestingPreservesOuterScope) {
    {
        CorrelationScope outer("outer-id");
        EXPECT_EQ(CorrelationScope::current(), "outer-id");

        {
            CorrelationScope inner("inner-id");
            EXPECT_EQ(CorrelationScope::current(), "inner-id");
        }

        EXPECT_EQ(CorrelationScope::current(), "outer-id");
    }

    EXPECT_TRUE(CorrelationScope::current().empty());
}

TEST(CorrelationScopeTest, ThreadLocalIsolation) {
    std::atomic<bool> workerReady{false};
    std::atomic<bool> mainDone{false};
    std::string workerValue;
    bool workerStartedEmpty = false;

    CorrelationScope scope("main-thread-id");

    std::thread t([&] {
        workerStartedEmpty = CorrelationScope::current().empty();

        CorrelationScope threadScope("thread-id");
        workerValue = CorrelationScope::current();
        workerReady.store(true);

        while (!mainDone.load()) {
            std::this_thread::yield();
        }
    });

    while (!workerReady.load()) {
        std::this_thread::yield();
    }

    EXPECT_EQ(CorrelationScope::current(), "main-thread-id");
    EXPECT_EQ(workerValue, "thread-id");

    mainDone.store(true);
    t.join();
    EXPECT_TRUE(workerStartedEmpty);
}

TEST(CorrelationScopeTest, JsonFormatterUsesThreadLocalId) {
    CorrelationScope scope("auto-corr-id");

    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "test");

    EXPECT_NE(json.find("\"correlation_id\":\"auto-corr-id\""), std::string::npos)
        << "Thread-local correlation ID not included: " << json;
}

TEST(CorrelationScopeTest, ContextCorrelationIdTakesPrecedence) {
    CorrelationScope scope("thread-id");

    LogContext ctx;
    ctx.correlationId = "explicit-id";

    auto json = JsonLogFormatter::format(
        LogLevel::Info, LogCategory::Core, "test", ctx);

    EXPECT_NE(json.find("\"correlation_id\":\"explicit-id\""), std::string::npos);
    EXPECT_EQ(json.find("thread-id"), std::string::npos);
}

// ===========================================================================
// Logger JSON Mode Integration Tests
// ===========================================================================

using LoggerJsonTest = LoggingTest;

TEST_F(LoggerJsonTest, JsonModeDefaultsToOff) {
    Logger logger;
    EXPECT_FALSE(logger.jsonOutput());
}

TEST_F(LoggerJsonTest, SetJsonOutputEmitsJsonRecords) {
    Logger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Info);
    logger.setJsonOutput(true);
    EXPECT_TRUE(logger.jsonOutput());

    logger.log(LogLevel::Info, LogCategory::Core, "JSON test");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_EQ(msg.front(), '{');
    EXPECT_EQ(msg.back(), '}');
    EXPECT_NE(msg.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(msg.find("\"category\":\"Core\""), std::string::npos);
    EXPECT_NE(msg.find("\"message\":\"JSON test\""), std::string::npos);
}
