#include <gtest/gtest.h>
#include "update/ManifestUpdateSource.hpp"
#include "update/UpdateErrors.hpp"

using namespace configdesk;

namespace {
UpdateManifest manifest(const std::string& version) {
    return UpdateManifest::parse(R"({
        "version": ")" + version + R"(",
        "notes": "New dashboard",
        "pub_date": "2024-06-01T00:00:00Z",
        "platforms": {
            "linux-x86_64": {
                "url": "https://example.com/configdesk",
                "signature": "untrusted comment: x",
                "sha256": "00ff"
            }
        }
    })");
}

Version current(const std::string& text) {
    return Version::parse(text).value();
}
} // namespace

TEST(ManifestUpdateSourceTest, ExpandsEndpointTemplates) {
    EXPECT_EQ(ManifestUpdateSource::expandEndpoint(
                  "https://updates.example.com/{{target}}/{{arch}}/{{current_version}}",
                  "1.2.0-beta.1", "linux", "x86_64"),
              "https://updates.example.com/linux/x86_64/1.2.0-beta.1");
    EXPECT_EQ(ManifestUpdateSource::expandEndpoint(
                  "https://example.com/latest.json", "1.0.0", "linux", "aarch64"),
              "https://example.com/latest.json");
    EXPECT_EQ(ManifestUpdateSource::expandEndpoint(
                  "https://example.com/{{arch}}/{{arch}}", "1.0.0", "linux", "armv7"),
              "https://example.com/armv7/armv7");
}

TEST(ManifestUpdateSourceTest, NewerVersionIsAnUpdate) {
    auto update = ManifestUpdateSource::evaluate(manifest("1.3.0"), current("1.2.9"), "x86_64");
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->version, "1.3.0");
    EXPECT_EQ(update->currentVersion, "1.2.9");
    EXPECT_EQ(update->body, std::optional<std::string>("New dashboard"));
    EXPECT_EQ(update->date, std::optional<std::string>("2024-06-01T00:00:00Z"));
    EXPECT_EQ(update->target, "linux-x86_64");
    EXPECT_EQ(update->downloadUrl, "https://example.com/configdesk");
    EXPECT_EQ(update->signature, std::optional<std::string>("untrusted comment: x"));
    EXPECT_EQ(update->sha256, std::optional<std::string>("00ff"));
}

TEST(ManifestUpdateSourceTest, SameOrOlderVersionIsNotAnUpdate) {
    EXPECT_FALSE(ManifestUpdateSource::evaluate(manifest("1.3.0"), current("1.3.0"), "x86_64").has_value());
    EXPECT_FALSE(ManifestUpdateSource::evaluate(manifest("1.2.0"), current("1.3.0"), "x86_64").has_value());
    // A pre-release of the running version is older
    EXPECT_FALSE(ManifestUpdateSource::evaluate(manifest("1.3.0-rc.1"), current("1.3.0"), "x86_64").has_value());
}

TEST(ManifestUpdateSourceTest, ReleaseAfterPreReleaseIsAnUpdate) {
    EXPECT_TRUE(ManifestUpdateSource::evaluate(manifest("1.3.0"), current("1.3.0-rc.2"), "x86_64").has_value());
}

TEST(ManifestUpdateSourceTest, MissingPlatformIsACheckError) {
    EXPECT_THROW(ManifestUpdateSource::evaluate(manifest("9.0.0"), current("1.0.0"), "aarch64"),
                 UpdateCheckError);
    // ...but only when there is something newer to install
    EXPECT_NO_THROW(ManifestUpdateSource::evaluate(manifest("1.0.0"), current("1.0.0"), "aarch64"));
}

TEST(ManifestUpdateSourceTest, NoEndpointsIsACheckError) {
    ManifestUpdateSource source({}, "1.0.0", UpdateInstaller("/tmp/configdesk-test-target"));
    EXPECT_THROW(source.check(), UpdateCheckError);
}

TEST(ManifestUpdateSourceTest, InvalidRunningVersionIsACheckError) {
    ManifestUpdateSource source({"http://127.0.0.1:1/latest.json"}, "dev-build",
                                UpdateInstaller("/tmp/configdesk-test-target"));
    EXPECT_THROW(source.check(), UpdateCheckError);
}

TEST(ManifestUpdateSourceTest, UnreachableEndpointsAreACheckError) {
    // Port 1 on loopback refuses connections immediately
    ManifestUpdateSource source({"http://127.0.0.1:1/a.json", "http://127.0.0.1:1/b.json"}, "1.0.0",
                                UpdateInstaller("/tmp/configdesk-test-target"), 2000);
    try {
        source.check();
        FAIL() << "expected UpdateCheckError";
    } catch (const UpdateCheckError& e) {
        // The last endpoint tried is the one reported
        EXPECT_NE(std::string(e.what()).find("b.json"), std::string::npos) << e.what();
    }
}
