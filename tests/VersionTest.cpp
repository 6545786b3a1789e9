#include <gtest/gtest.h>
#include "update/Version.hpp"

using namespace configdesk;

namespace {
Version v(const std::string& text) {
    auto parsed = Version::parse(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed.value_or(Version{});
}
} // namespace

TEST(VersionTest, ParsesCoreAndPrefix) {
    Version version = v("v1.12.3");
    EXPECT_EQ(version.major, 1u);
    EXPECT_EQ(version.minor, 12u);
    EXPECT_EQ(version.patch, 3u);
    EXPECT_TRUE(version.preRelease.empty());
    EXPECT_EQ(version.toString(), "1.12.3");
}

TEST(VersionTest, ParsesPreReleaseAndBuild) {
    Version version = v("2.0.0-rc.1+build.5");
    EXPECT_EQ(version.preRelease, (std::vector<std::string>{"rc", "1"}));
    EXPECT_EQ(version.build, "build.5");
    EXPECT_EQ(version.toString(), "2.0.0-rc.1+build.5");
}

TEST(VersionTest, RejectsMalformedVersions) {
    for (const char* bad : {"", "1", "1.2", "1.2.3.4", "01.2.3", "1.2.x", "1.2.3-", "1.2.3-01",
                            "1.2.3+", "1.2.3-a..b", " 1.2.3", "version"}) {
        EXPECT_FALSE(Version::parse(bad).has_value()) << bad;
    }
}

TEST(VersionTest, OrdersByCoreNumbersNumerically) {
    EXPECT_LT(v("1.9.0"), v("1.10.0"));
    EXPECT_LT(v("1.2.3"), v("1.2.4"));
    EXPECT_LT(v("1.99.99"), v("2.0.0"));
    EXPECT_EQ(v("1.2.3"), v("v1.2.3"));
}

TEST(VersionTest, FollowsPreReleasePrecedence) {
    const std::vector<std::string> ordered = {
        "1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta", "1.0.0-beta",
        "1.0.0-beta.2", "1.0.0-beta.11", "1.0.0-rc.1", "1.0.0",
    };
    for (size_t i = 0; i + 1 < ordered.size(); ++i) {
        EXPECT_LT(v(ordered[i]), v(ordered[i + 1])) << ordered[i] << " < " << ordered[i + 1];
        EXPECT_GT(v(ordered[i + 1]), v(ordered[i]));
    }
}

TEST(VersionTest, IgnoresBuildMetadata) {
    EXPECT_EQ(v("1.0.0+20240101"), v("1.0.0+other"));
    EXPECT_FALSE(v("1.0.0+2") > v("1.0.0+1"));
}
