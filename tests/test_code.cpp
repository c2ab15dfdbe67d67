#include <gtest/gtest.h>
#include <keygate/code.hpp>
#include <keygate/json.hpp>

#include <map>
#include <regex>
#include <set>

namespace keygate {
namespace {

const Timestamp kIssuedAt = json::from_millis(1700000000000);

// ==================== Generation Tests ====================

TEST(CodeGenerateTest, HasPrefixTimestampAndSuffix) {
    auto result = code::generate(code::DEFAULT_PREFIX, kIssuedAt);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_TRUE(std::regex_match(result.value(), std::regex("^YSK-1700000000000-[0-9A-Z]{4}$")))
        << result.value();
    EXPECT_TRUE(code::is_well_formed(result.value()));
}

TEST(CodeGenerateTest, HonorsPrefixAndSuffixLength) {
    auto result = code::generate("ACME2", kIssuedAt, 8);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(std::regex_match(result.value(), std::regex("^ACME2-1700000000000-[0-9A-Z]{8}$")));
    EXPECT_TRUE(code::is_well_formed(result.value(), "ACME2", 8));
}

TEST(CodeGenerateTest, RejectsBadPrefix) {
    EXPECT_EQ(code::generate("", kIssuedAt).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(code::generate("YS-K", kIssuedAt).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(code::generate("YSK/", kIssuedAt).error_code(), ErrorCode::ValidationError);
}

TEST(CodeGenerateTest, RejectsShortSuffix) {
    for (std::size_t length : {0, 1, 2, 3}) {
        EXPECT_EQ(code::generate("YSK", kIssuedAt, length).error_code(), ErrorCode::ValidationError)
            << length;
    }
    EXPECT_TRUE(code::generate("YSK", kIssuedAt, code::DEFAULT_SUFFIX_LENGTH).is_ok());
}

TEST(CodeGenerateTest, SameMillisecondStillDiffers) {
    std::set<std::string> codes;
    for (int i = 0; i < 200; ++i) {
        codes.insert(code::generate("YSK", kIssuedAt, 8).value());
    }

    // 36^8 suffixes: a repeat here would point at a broken generator
    EXPECT_EQ(codes.size(), 200u);
}

TEST(RandomSuffixTest, UsesWholeAlphabet) {
    auto suffix = code::random_suffix(20000);
    ASSERT_TRUE(suffix.is_ok());
    ASSERT_EQ(suffix.value().size(), 20000u);

    std::map<char, int> counts;
    for (char c : suffix.value()) {
        counts[c]++;
    }

    // Expected ~555 each; bounds are loose enough never to flake
    EXPECT_EQ(counts.size(), 36u);
    for (const auto& [c, n] : counts) {
        EXPECT_GT(n, 300) << c;
        EXPECT_LT(n, 850) << c;
    }
}

// ==================== Shape Tests ====================

TEST(CodeShapeTest, WellFormedCodes) {
    EXPECT_TRUE(code::is_well_formed("YSK-1700000000000-7K2Q"));
    EXPECT_TRUE(code::is_well_formed("YSK-0-AAAA"));
}

TEST(CodeShapeTest, MalformedCodes) {
    EXPECT_FALSE(code::is_well_formed(""));
    EXPECT_FALSE(code::is_well_formed("YSK--7K2Q"));
    EXPECT_FALSE(code::is_well_formed("ABC-1700000000000-7K2Q"));
    EXPECT_FALSE(code::is_well_formed("YSK-17000x0000000-7K2Q"));
    EXPECT_FALSE(code::is_well_formed("YSK-1700000000000-7k2q"));
    EXPECT_FALSE(code::is_well_formed("YSK-1700000000000-7K2"));
    EXPECT_FALSE(code::is_well_formed("YSK1700000000000-7K2Q"));
}

TEST(CodeShapeTest, PrefixValidation) {
    EXPECT_TRUE(code::is_valid_prefix("YSK"));
    EXPECT_TRUE(code::is_valid_prefix("a1"));
    EXPECT_FALSE(code::is_valid_prefix(""));
    EXPECT_FALSE(code::is_valid_prefix("Y K"));
}

}  // namespace
}  // namespace keygate
