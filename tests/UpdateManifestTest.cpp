#include <gtest/gtest.h>
#include "update/UpdateErrors.hpp"
#include "update/UpdateManifest.hpp"

using namespace configdesk;

namespace {
const char* kManifest = R"({
    "version": "v1.4.0",
    "notes": "Bug fixes",
    "pub_date": "2024-05-01T12:00:00Z",
    "platforms": {
        "linux-x86_64": { "url": "https://example.com/configdesk-x86_64", "signature": "sig-plain" },
        "linux-x86_64-appimage": {
            "url": "https://example.com/configdesk-x86_64.AppImage",
            "signature": "sig-appimage",
            "sha256": "ABCDEF"
        },
        "darwin-aarch64": { "url": "https://example.com/configdesk.app.tar.gz" }
    }
})";
} // namespace

TEST(UpdateManifestTest, ParsesAllFields) {
    UpdateManifest manifest = UpdateManifest::parse(kManifest);

    EXPECT_EQ(manifest.version.toString(), "1.4.0");
    ASSERT_TRUE(manifest.notes.has_value());
    EXPECT_EQ(*manifest.notes, "Bug fixes");
    ASSERT_TRUE(manifest.pubDate.has_value());
    EXPECT_EQ(*manifest.pubDate, "2024-05-01T12:00:00Z");
    EXPECT_EQ(manifest.platforms.size(), 3u);

    const auto& appImage = manifest.platforms.at("linux-x86_64-appimage");
    EXPECT_EQ(appImage.url, "https://example.com/configdesk-x86_64.AppImage");
    EXPECT_EQ(appImage.signature, std::optional<std::string>("sig-appimage"));
    EXPECT_EQ(appImage.sha256, std::optional<std::string>("ABCDEF"));
    EXPECT_FALSE(manifest.platforms.at("darwin-aarch64").signature.has_value());
}

TEST(UpdateManifestTest, PrefersAppImageTarget) {
    UpdateManifest manifest = UpdateManifest::parse(kManifest);

    auto targets = UpdateManifest::targetsFor("x86_64");
    EXPECT_EQ(targets, (std::vector<std::string>{"linux-x86_64-appimage", "linux-x86_64"}));

    auto found = manifest.findPlatform(targets);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->first, "linux-x86_64-appimage");

    EXPECT_FALSE(manifest.findPlatform(UpdateManifest::targetsFor("aarch64")).has_value());
}

TEST(UpdateManifestTest, OptionalFieldsMayBeMissingOrNull) {
    UpdateManifest manifest = UpdateManifest::parse(R"({
        "version": "1.0.1",
        "notes": null,
        "platforms": { "linux-aarch64": { "url": "https://example.com/a" } }
    })");
    EXPECT_FALSE(manifest.notes.has_value());
    EXPECT_FALSE(manifest.pubDate.has_value());
    EXPECT_FALSE(manifest.platforms.at("linux-aarch64").sha256.has_value());
}

TEST(UpdateManifestTest, RejectsBrokenManifests) {
    const std::vector<std::string> broken = {
        "",
        "not json",
        "[1, 2, 3]",
        R"({"platforms": {}})",
        R"({"version": "latest", "platforms": {}})",
        R"({"version": 2, "platforms": {}})",
        R"({"version": "1.0.0"})",
        R"({"version": "1.0.0", "platforms": {"linux-x86_64": {}}})",
        R"({"version": "1.0.0", "platforms": {"linux-x86_64": "https://example.com"}})",
        R"({"version": "1.0.0", "notes": 5, "platforms": {}})",
    };
    for (const auto& json : broken) {
        EXPECT_THROW(UpdateManifest::parse(json), UpdateCheckError) << json;
    }
}
