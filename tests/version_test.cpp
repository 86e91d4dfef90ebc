//
// Created by Giuseppe Francione on 12/12/25.
//

#include <gtest/gtest.h>
#include "errors.hpp"
#include "updater/version.hpp"

using namespace pixtrim;

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, ParsesTagsWithAndWithoutPrefix) {
    EXPECT_EQ(Version::parse("1.2.3"), (Version{1, 2, 3}));
    EXPECT_EQ(Version::parse("v1.2.3"), (Version{1, 2, 3}));
    EXPECT_EQ(Version::parse("V10.0.1"), (Version{10, 0, 1}));
}

TEST_F(VersionTest, MissingComponentsAreZero) {
    EXPECT_EQ(Version::parse("2"), (Version{2, 0, 0}));
    EXPECT_EQ(Version::parse("1.0"), (Version{1, 0, 0}));
}

TEST_F(VersionTest, Ordering) {
    EXPECT_LT(Version::parse("1.0"), Version::parse("1.0.1"));
    EXPECT_LT(Version::parse("1.0.9"), Version::parse("1.1.0"));
    EXPECT_LT(Version::parse("1.9.0"), Version::parse("1.10.0"));
    EXPECT_LT(Version::parse("v1.0.0"), Version::parse("2.0.0"));
    EXPECT_EQ(Version::parse("v1.0.0"), Version::parse("1.0"));
    EXPECT_GT(Version::parse("1.1.0"), Version::parse("1.0.0"));
}

TEST_F(VersionTest, ToString) {
    EXPECT_EQ(Version::parse("v3.4").to_string(), "3.4.0");
}

TEST_F(VersionTest, MalformedIsParseError) {
    for (const char* bad : {"", "v", "1..2", "1.2.3.4", "1.x", "latest", "1.2-beta"}) {
        try {
            (void) Version::parse(bad);
            FAIL() << "expected ParseError for '" << bad << "'";
        } catch (const UpdateError& e) {
            EXPECT_EQ(e.kind(), UpdateErrorKind::ParseError) << bad;
        }
    }
}
