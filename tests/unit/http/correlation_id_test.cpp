#include <gtest/gtest.h>

#include <set>
#include <string>

#include "bulwark/http/correlation_id.hpp"

using bulwark::http::CorrelationIdGenerator;

TEST(CorrelationIdTest, GenerateUsesPrefixAndCounter) {
    CorrelationIdGenerator ids("probe", 8);
    auto first = ids.generate();
    auto second = ids.generate();

    EXPECT_EQ(first.rfind("probe-", 0), 0u);
    EXPECT_NE(first, second);
    EXPECT_EQ(ids.counter(), 2u);
    EXPECT_TRUE(CorrelationIdGenerator::validate(first));
}

TEST(CorrelationIdTest, RandomSuffixHasRequestedLength) {
    CorrelationIdGenerator ids("x", 12);
    auto id = ids.generate();
    auto suffix = id.substr(id.rfind('-') + 1);
    EXPECT_EQ(suffix.size(), 12u);
    EXPECT_EQ(suffix.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CorrelationIdTest, EmptyPrefixOmitsLeadingDash) {
    CorrelationIdGenerator ids("", 0);
    auto id = ids.generate();
    EXPECT_NE(id.front(), '-');
    EXPECT_NE(id.back(), '-');
}

TEST(CorrelationIdTest, GenerateWithPrefixOverridesDefault) {
    CorrelationIdGenerator ids;
    EXPECT_EQ(ids.prefix(), "bulwark");
    EXPECT_EQ(ids.generateWithPrefix("batch").rfind("batch-", 0), 0u);
}

TEST(CorrelationIdTest, ShortAndUuidForms) {
    CorrelationIdGenerator ids;
    auto shortId = ids.generateShort();
    EXPECT_EQ(shortId.substr(0, 16).find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(shortId.substr(16), "-1");

    auto uuid = ids.generateUuid();
    EXPECT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[14], '4');
    EXPECT_TRUE(CorrelationIdGenerator::validate(uuid));
}

TEST(CorrelationIdTest, IdsAreUnique) {
    CorrelationIdGenerator ids;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(ids.generate());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(CorrelationIdTest, ResetRestartsCounter) {
    CorrelationIdGenerator ids;
    (void)ids.generate();
    (void)ids.generate();
    ids.reset();
    EXPECT_EQ(ids.counter(), 0u);
}

TEST(CorrelationIdTest, Validate) {
    EXPECT_TRUE(CorrelationIdGenerator::validate("abcd-1234"));
    EXPECT_FALSE(CorrelationIdGenerator::validate("short"));
    EXPECT_FALSE(CorrelationIdGenerator::validate("has space 123"));
    EXPECT_FALSE(CorrelationIdGenerator::validate("under_score_id"));
}
