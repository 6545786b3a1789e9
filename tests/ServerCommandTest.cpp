#include <gtest/gtest.h>
#include "server/ServerCommand.hpp"
#include "TestUtils.hpp"

using namespace configdesk;
using configdesk::test::TempDir;
namespace fs = std::filesystem;

TEST(ServerCommandTest, ServerArgumentsAreFixed) {
    EXPECT_EQ(serverArguments("cli.js"),
              (std::vector<std::string>{"cli.js", "ui", "--foreground", "--port", "3333"}));
}

TEST(ServerCommandTest, ProductionModeWhenServerDirExists) {
    TempDir resources;
    TempDir sidecar;
    resources.write("server/cli.js", "// bundled");

    CommandSpec spec = resolveServerCommand(resources.path(), sidecar.path(), resources.path());

    EXPECT_EQ(spec.mode, LaunchMode::Production);
    EXPECT_EQ(spec.executable, (sidecar.path() / "node-server").string());
    ASSERT_EQ(spec.args.size(), 5u);
    EXPECT_TRUE(fs::path(spec.args[0]).is_absolute());
    EXPECT_EQ(fs::path(spec.args[0]), fs::absolute(resources.path() / "server" / "cli.js"));
    EXPECT_EQ(std::vector<std::string>(spec.args.begin() + 1, spec.args.end()),
              (std::vector<std::string>{"ui", "--foreground", "--port", "3333"}));
    ASSERT_EQ(spec.environment.size(), 1u);
    EXPECT_EQ(spec.environment.at("NODE_PATH"), (resources.path() / "server" / "node_modules").string());
}

TEST(ServerCommandTest, DevelopmentModeDefaultsToParentCli) {
    TempDir resources;
    TempDir work;
    // Nothing named cli.js anywhere near work/a/b
    const fs::path workingDir = work.path() / "a" / "b";
    fs::create_directories(workingDir);

    CommandSpec spec = resolveServerCommand(resources.path(), resources.path(), workingDir);

    EXPECT_EQ(spec.mode, LaunchMode::Development);
    EXPECT_EQ(spec.executable, "node");
    EXPECT_EQ(spec.args, (std::vector<std::string>{"../cli.js", "ui", "--foreground", "--port", "3333"}));
    EXPECT_TRUE(spec.environment.empty());
}

TEST(ServerCommandTest, DevelopmentCandidatesAreProbedInOrder) {
    TempDir work;
    const fs::path workingDir = work.path() / "a" / "b";
    fs::create_directories(workingDir);

    work.write("a/b/cli.js", "");
    EXPECT_EQ(findDevCliPath(workingDir), "cli.js");

    work.write("cli.js", "");
    EXPECT_EQ(findDevCliPath(workingDir), "../../cli.js");

    work.write("a/cli.js", "");
    EXPECT_EQ(findDevCliPath(workingDir), "../cli.js");
}

TEST(ServerCommandTest, CommandLineQuotesArguments) {
    CommandSpec spec;
    spec.executable = "node";
    spec.args = {"/opt/my app/cli.js", "ui"};
    EXPECT_EQ(spec.commandLine(), "node '/opt/my app/cli.js' ui");
}

TEST(ServerCommandTest, ResourceRootOverrideWins) {
    TempDir resources;
    EXPECT_EQ(resolveResourceRoot(resources.path().string()), resources.path());
}

TEST(ServerCommandTest, ResourceRootDefaultsNextToExecutable) {
    const fs::path root = resolveResourceRoot();
    EXPECT_FALSE(root.empty());
    EXPECT_TRUE(fs::is_directory(root));
}
