#include <gtest/gtest.h>
#include "update/UpdateErrors.hpp"
#include "update/UpdateInstaller.hpp"
#include "TestUtils.hpp"

#include <cstdlib>
#include <sys/stat.h>

using namespace configdesk;
using configdesk::test::TempDir;
using configdesk::test::readFile;
namespace fs = std::filesystem;

TEST(UpdateInstallerTest, HashesFileContent) {
    TempDir temp;
    auto file = temp.write("abc.bin", "abc");
    EXPECT_EQ(UpdateInstaller::sha256File(file.string()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = temp.write("empty.bin", "");
    EXPECT_EQ(UpdateInstaller::sha256File(empty.string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(UpdateInstallerTest, HashingMissingFileFails) {
    EXPECT_THROW(UpdateInstaller::sha256File("/nonexistent/configdesk.bin"), InstallError);
}

TEST(UpdateInstallerTest, VerifyAcceptsEitherCase) {
    TempDir temp;
    auto file = temp.write("abc.bin", "abc");
    UpdateInstaller installer((temp.path() / "configdesk").string());

    EXPECT_NO_THROW(installer.verify(file.string(),
        "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_THROW(installer.verify(file.string(), std::string(64, '0')), InstallError);
}

TEST(UpdateInstallerTest, StagesBesideTarget) {
    UpdateInstaller installer("/opt/apps/Claude_Config.AppImage");
    EXPECT_EQ(installer.target(), "/opt/apps/Claude_Config.AppImage");
    EXPECT_EQ(installer.stagingPath(), "/opt/apps/.Claude_Config.AppImage.update");
}

TEST(UpdateInstallerTest, InstallReplacesTargetAndMakesItExecutable) {
    TempDir temp;
    auto target = temp.write("configdesk", "old build");
    UpdateInstaller installer(target.string());
    auto staged = temp.write(fs::path(installer.stagingPath()).filename().string(), "new build");
    ASSERT_EQ(staged.string(), installer.stagingPath());

    installer.install(staged.string());

    EXPECT_FALSE(fs::exists(staged));
    EXPECT_EQ(readFile(target), "new build");
    struct stat info {};
    ASSERT_EQ(stat(target.c_str(), &info), 0);
    EXPECT_TRUE(info.st_mode & S_IXUSR);
}

TEST(UpdateInstallerTest, InstallWithoutStagedFileFails) {
    TempDir temp;
    auto target = temp.write("configdesk", "old build");
    UpdateInstaller installer(target.string());

    EXPECT_THROW(installer.install(installer.stagingPath()), InstallError);
    EXPECT_EQ(readFile(target), "old build");
}

TEST(UpdateInstallerTest, InstallIntoMissingDirectoryFails) {
    TempDir temp;
    auto staged = temp.write("staged", "new build");
    UpdateInstaller installer((temp.path() / "missing" / "configdesk").string());

    EXPECT_THROW(installer.install(staged.string()), InstallError);
}

TEST(UpdateInstallerTest, DiscardRemovesStagedFile) {
    TempDir temp;
    auto staged = temp.write("staged", "partial");
    UpdateInstaller installer((temp.path() / "configdesk").string());

    installer.discard(staged.string());
    EXPECT_FALSE(fs::exists(staged));
    // Nothing to remove is fine too
    installer.discard(staged.string());
}

TEST(UpdateInstallerTest, AppImageIsTheInstallTarget) {
    const char* previous = std::getenv("APPIMAGE");
    const std::string saved = previous ? previous : "";

    setenv("APPIMAGE", "/home/user/Apps/Claude_Config.AppImage", 1);
    EXPECT_EQ(UpdateInstaller::installTarget(), "/home/user/Apps/Claude_Config.AppImage");

    unsetenv("APPIMAGE");
    EXPECT_EQ(UpdateInstaller::installTarget(), fs::read_symlink("/proc/self/exe").string());

    if (previous) {
        setenv("APPIMAGE", saved.c_str(), 1);
    }
}
