#include <gtest/gtest.h>
#include <core/semver.hpp>

struct SemverCase {
    const char* version;
    const char* constraint;
    bool expected;
};

class SatisfiesTest : public ::testing::TestWithParam<SemverCase> {};

TEST_P(SatisfiesTest, Table) {
    const auto& c = GetParam();
    EXPECT_EQ(satisfies(c.version, c.constraint), c.expected)
        << c.version << " vs '" << c.constraint << "'";
}

INSTANTIATE_TEST_SUITE_P(Constraints, SatisfiesTest, ::testing::Values(
    SemverCase{"1.2.3", "", true},
    SemverCase{"garbage", "", true},
    SemverCase{"1.2.3", "*", true},
    SemverCase{"1.2.3", ">=1.2.0", true},
    SemverCase{"1.1.9", ">=1.2.0", false},
    SemverCase{"v1.2.0", ">=1.2", true},
    SemverCase{"1.2.0", ">1.2.0", false},
    SemverCase{"1.3.0", ">1.2", true},
    SemverCase{"1.2.9", ">1.2", false},
    SemverCase{"1.9.9", "<2", true},
    SemverCase{"2.0.0", "<2", false},
    SemverCase{"2.0.5", "<=2.0", true},
    SemverCase{"2.1.0", "<=2.0", false},
    SemverCase{"1.4.0", "^1.2", true},
    SemverCase{"2.0.0", "^1.2", false},
    SemverCase{"0.3.5", "^0.3", true},
    SemverCase{"0.4.0", "^0.3", false},
    SemverCase{"0.0.3", "^0.0.3", true},
    SemverCase{"0.0.4", "^0.0.3", false},
    SemverCase{"1.2.7", "~1.2.3", true},
    SemverCase{"1.3.0", "~1.2.3", false},
    SemverCase{"1.2.2", "~1.2.3", false},
    SemverCase{"1.0.0", "=1.0.0", true},
    SemverCase{"1.0.1", "=1.0.0", false},
    SemverCase{"1.0.0", "1.0.0", true},
    SemverCase{"1.7.2", "1.x", true},
    SemverCase{"2.0.0", "1.x", false},
    SemverCase{"1.2.9", "1.2.x", true},
    SemverCase{"1.3.0", "1.2.x", false},
    SemverCase{"1.5.0", ">=1.2.0 <2.0.0", true},
    SemverCase{"2.5.0", ">=1.2.0 <2.0.0", false},
    SemverCase{"1.2.3-rc1", ">=1.2.3", true},
    SemverCase{"", ">=1.0.0", false},
    SemverCase{"release-candidate", "^1.0", false}
));

TEST(Semver, ParseIgnoresPrefixAndSuffix) {
    auto v = parse_semver("v2.10.4+build.7");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->major, 2);
    EXPECT_EQ(v->minor, 10);
    EXPECT_EQ(v->patch, 4);
}

TEST(Semver, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_semver("").has_value());
    EXPECT_FALSE(parse_semver("abc").has_value());
    EXPECT_FALSE(parse_semver("1.2.3.4").has_value());
}

TEST(Semver, CompareOrdersComponents) {
    EXPECT_LT(compare_semver({1, 2, 3}, {1, 10, 0}), 0);
    EXPECT_GT(compare_semver({2, 0, 0}, {1, 99, 99}), 0);
    EXPECT_EQ(compare_semver({1, 2, 3}, {1, 2, 3}), 0);
}

TEST(Semver, ConstraintValidation) {
    EXPECT_TRUE(is_valid_constraint(""));
    EXPECT_TRUE(is_valid_constraint(">=1.2.0 <2"));
    EXPECT_TRUE(is_valid_constraint("~1.2"));
    EXPECT_FALSE(is_valid_constraint(">=abc"));
    EXPECT_FALSE(is_valid_constraint("1.x.3"));
}
