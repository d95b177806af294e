#include <gtest/gtest.h>
#include "fakes.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/commands.hpp"
#include "artifact/Cache.hpp"
#include "archive/TarArchiver.hpp"
#include "runtime/Environment.hpp"
#include "transfer/Engine.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace vc;
using namespace vc::shell;
using namespace vc::test;

TEST(ShellParserTest, GlobalOptionsBeforeTheCommand) {
    const auto call = parseArgs({"--config", "/tmp/c.yaml", "--cache=repo", "resolve", "name", "ns", "/dest"});
    EXPECT_EQ(call.name, "resolve");
    EXPECT_EQ(optVal(call, "config"), "/tmp/c.yaml");
    EXPECT_EQ(optVal(call, "cache"), "repo");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"name", "ns", "/dest"}));
}

TEST(ShellParserTest, CommandOptionsAndPositionalsInterleave) {
    const auto call = parseArgs({"publish", "name", "--task-id", "T", "ns", "--rank", "-5"});
    EXPECT_EQ(call.name, "publish");
    EXPECT_EQ(optVal(call, "task-id"), "T");
    EXPECT_EQ(optVal(call, "rank"), "-5");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"name", "ns"}));
}

TEST(ShellParserTest, SentinelStopsFlagParsing) {
    const auto call = parseArgs({"package", "n", "/cwd", "--", "--weird-file", "b"});
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"n", "/cwd", "--weird-file", "b"}));
    EXPECT_FALSE(optVal(call, "weird-file").has_value());
}

TEST(ShellParserTest, HelpSwitch) {
    EXPECT_EQ(parseArgs({"--help"}).name, "help");
    EXPECT_EQ(parseArgs({"-h"}).name, "help");
    const auto call = parseArgs({"-h", "resolve"});
    EXPECT_EQ(call.name, "resolve");
    EXPECT_TRUE(hasFlag(call, "h"));
}

TEST(ShellParserTest, JsonIsASwitch) {
    const auto call = parseArgs({"--json", "path", "foo"});
    EXPECT_EQ(call.name, "path");
    EXPECT_TRUE(hasFlag(call, "json"));
    EXPECT_EQ(call.positionals, std::vector<std::string>{"foo"});
    EXPECT_EQ(parseArgs({"--json"}).name, "");
}

TEST(ShellParserTest, LastOptionWins) {
    const auto call = parseArgs({"path", "--cache", "a", "--cache", "b", "x"});
    EXPECT_EQ(optVal(call, "cache"), "b");
}

TEST(ShellArgsTest, Numbers) {
    EXPECT_EQ(parseUInt("30"), 30u);
    EXPECT_FALSE(parseUInt("-1").has_value());
    EXPECT_FALSE(parseUInt("99999999999").has_value());
    EXPECT_EQ(parseInt64("-5"), -5);
    EXPECT_EQ(parseInt64("1700000000123"), 1700000000123);
    EXPECT_FALSE(parseInt64("12x").has_value());
    EXPECT_FALSE(parseInt64("").has_value());
}

class ShellRouterTest : public ::testing::Test {
protected:
    TempDir root{"shell"};
    std::shared_ptr<runtime::StaticEnvironment> env = std::make_shared<runtime::StaticEnvironment>();
    std::shared_ptr<InMemoryIndex> index = std::make_shared<InMemoryIndex>();
    std::shared_ptr<InMemoryStorage> storage = std::make_shared<InMemoryStorage>(root / "blobs");
    std::shared_ptr<FileCopyTransferer> transport = std::make_shared<FileCopyTransferer>();
    std::vector<std::string> requestedProfiles;
    Router router;

    void SetUp() override {
        env->set("HOME", (root / "home").string());
        writeTextFile(root / "src" / "README", "hello");

        CommandContext ctx;
        ctx.cache = [this](const std::string& profile) {
            requestedProfiles.push_back(profile);
            const config::Config cfg;
            return std::make_shared<artifact::Cache>(artifact::PathResolver(cfg.profile(profile), env),
                                                     index, storage,
                                                     std::make_shared<transfer::Engine>(transport),
                                                     std::make_shared<archive::TarArchiver>(), env);
        };
        ctx.hasProfile = [](const std::string& profile) { return config::Config{}.caches.contains(profile); };
        ctx.effectiveConfig = [] { return nlohmann::json(config::Config{}); };
        registerAllCommands(router, ctx);
    }

    CommandResult run(const std::vector<std::string>& args) const { return router.execute(args); }
};

TEST_F(ShellRouterTest, HelpListsEveryCommand) {
    const auto res = run({"help"});
    EXPECT_EQ(res.exit_code, EXIT_OK);
    for (const auto* cmd : {"resolve", "package", "publish", "path", "config"})
        EXPECT_NE(res.stdout_text.find(cmd), std::string::npos) << cmd;
}

TEST_F(ShellRouterTest, UnknownCommandIsAUsageError) {
    const auto res = run({"frobnicate"});
    EXPECT_EQ(res.exit_code, EXIT_USAGE);
    EXPECT_NE(res.stderr_text.find("Unknown command"), std::string::npos);
    EXPECT_EQ(run({}).exit_code, EXIT_USAGE);
}

TEST_F(ShellRouterTest, MissingArgumentsIsAUsageError) {
    const auto res = run({"resolve", "only-a-name"});
    EXPECT_EQ(res.exit_code, EXIT_USAGE);
    EXPECT_NE(res.stderr_text.find("resolve <name> <namespace> <destination>"), std::string::npos);
    EXPECT_TRUE(requestedProfiles.empty());
}

TEST_F(ShellRouterTest, ResolveMissExitsWithNotFound) {
    const auto res = run({"resolve", "foo", "tc-vcs.v1.clones.x", (root / "dest").string()});
    EXPECT_EQ(res.exit_code, EXIT_NOT_FOUND);
    EXPECT_EQ(requestedProfiles, std::vector<std::string>{"clones"});
}

TEST_F(ShellRouterTest, PackagePublishResolve) {
    const auto packaged = run({"package", "foo", (root / "src").string(), "README"});
    ASSERT_EQ(packaged.exit_code, EXIT_OK) << packaged.stderr_text;
    EXPECT_NE(packaged.stdout_text.find("foo.tar.gz"), std::string::npos);

    const auto published = run({"publish", "foo", "ns.foo", "--task-id", "T1", "--run-id", "0",
                                "--rank", "7", "--expires-days", "2"});
    ASSERT_EQ(published.exit_code, EXIT_OK) << published.stderr_text;
    ASSERT_TRUE(published.has_data);
    EXPECT_EQ(published.data["rank"], 7);
    EXPECT_EQ(published.data["taskId"], "T1");
    EXPECT_EQ(storage->requests.at(0).storageName, "public/foo.tar.gz");

    fs::remove_all(root / "home");
    const auto resolved = run({"resolve", "foo", "ns.foo", (root / "out").string()});
    EXPECT_EQ(resolved.exit_code, EXIT_OK) << resolved.stderr_text;
    EXPECT_EQ(readTextFile(root / "out" / "README"), "hello");
}

TEST_F(ShellRouterTest, PublishRejectsBadNumbers) {
    EXPECT_EQ(run({"publish", "foo", "ns", "--rank", "high"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"publish", "foo", "ns", "--expires-days", "0"}).exit_code, EXIT_USAGE);
}

TEST_F(ShellRouterTest, PublishCapsExpiresDays) {
    run({"package", "foo", (root / "src").string(), "README"});

    const auto tooFar = run({"publish", "foo", "ns", "--task-id", "T", "--run-id", "0",
                             "--expires-days", std::to_string(MAX_EXPIRES_DAYS + 1)});
    EXPECT_EQ(tooFar.exit_code, EXIT_USAGE);
    EXPECT_NE(tooFar.stderr_text.find("between 1 and 3650"), std::string::npos);
    EXPECT_EQ(run({"publish", "foo", "ns", "--expires-days", "200000"}).exit_code, EXIT_USAGE);
    EXPECT_TRUE(storage->requests.empty());

    const auto longest = run({"publish", "foo", "ns", "--task-id", "T", "--run-id", "0",
                              "--expires-days", std::to_string(MAX_EXPIRES_DAYS)});
    EXPECT_EQ(longest.exit_code, EXIT_OK) << longest.stderr_text;
    EXPECT_EQ(storage->requests.size(), 1u);
}

TEST_F(ShellRouterTest, PublishBeforePackageIsFatal) {
    const auto res = run({"publish", "foo", "ns", "--task-id", "T", "--run-id", "0"});
    EXPECT_EQ(res.exit_code, EXIT_FATAL);
    EXPECT_NE(res.stderr_text.find("run package first"), std::string::npos);
}

TEST_F(ShellRouterTest, PathHonoursTheProfile) {
    const auto res = run({"--cache", "repo", "path", "foo"});
    EXPECT_EQ(res.exit_code, EXIT_OK);
    EXPECT_EQ(res.stdout_text, fmt::format("{}\npublic/foo.tar.gz\n",
                                           (root / "home" / ".tc-vcs-repo" / "sources" / "foo.tar.gz").string()));
    EXPECT_EQ(requestedProfiles, std::vector<std::string>{"repo"});
}

TEST_F(ShellRouterTest, UnknownProfileIsAUsageError) {
    const auto res = run({"--cache", "nope", "path", "foo"});
    EXPECT_EQ(res.exit_code, EXIT_USAGE);
    EXPECT_NE(res.stderr_text.find("Unknown cache profile 'nope'"), std::string::npos);
    EXPECT_NE(res.stderr_text.find("Usage: vcscache [--cache <profile>] path <name>"), std::string::npos);

    EXPECT_EQ(run({"--cache", "nope", "resolve", "foo", "ns", (root / "dest").string()}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"--cache", "nope", "package", "foo", (root / "src").string(), "README"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"--cache", "nope", "publish", "foo", "ns"}).exit_code, EXIT_USAGE);
    EXPECT_TRUE(requestedProfiles.empty());
}

TEST_F(ShellRouterTest, EscapingArtifactNameIsFatal) {
    const auto res = run({"path", "/etc/important"});
    EXPECT_EQ(res.exit_code, EXIT_FATAL);
    EXPECT_NE(res.stderr_text.find("must be relative"), std::string::npos);
}

TEST_F(ShellRouterTest, PathPayloadUnderJson) {
    const auto res = run({"--json", "path", "foo"});
    ASSERT_EQ(res.exit_code, EXIT_OK);
    ASSERT_TRUE(res.has_data);
    EXPECT_EQ(res.data["storageName"], "public/foo.tar.gz");

    const auto printed = nlohmann::json::parse(stdoutFor(res, true));
    EXPECT_EQ(printed["localPath"], (root / "home" / ".tc-vcs" / "clones" / "foo.tar.gz").string());
    EXPECT_EQ(stdoutFor(res, false), res.stdout_text);
}

TEST(ShellOutputTest, TextWhenThereIsNoPayload) {
    const auto res = ok("plain\n");
    EXPECT_EQ(stdoutFor(res, true), "plain\n");
    EXPECT_EQ(stdoutFor(res, false), "plain\n");
}

TEST_F(ShellRouterTest, ConfigDumpsJson) {
    const auto res = run({"config"});
    ASSERT_EQ(res.exit_code, EXIT_OK);
    const auto j = nlohmann::json::parse(res.stdout_text);
    EXPECT_EQ(j["transfer"]["upload_attempts"], 10);
}

TEST_F(ShellRouterTest, AliasesResolveToTheCanonicalCommand) {
    EXPECT_TRUE(router.hasCommand("use"));
    EXPECT_TRUE(router.hasCommand("UPLOAD"));
    EXPECT_FALSE(router.hasCommand("frobnicate"));
}
