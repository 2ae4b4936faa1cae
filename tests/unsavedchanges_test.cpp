#include "installconfig.h"
#include "unsavedchanges.h"

#include "fakecommandrunner.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

static const char *savedConfig =
    "interfaces {\n"
    "    ethernet eth0 {\n"
    "        address dhcp\n"
    "    }\n"
    "}\n"
    "// Warning: Do not remove the following line.\n"
    "// vyos-config-version: \"bgp@5:interfaces@31\"\n";

class ConfigSessionCheckerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        config.configDir = tmp.path();
        QFile f(tmp.path() + "/config.boot");
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write(savedConfig);
    }

    QTemporaryDir tmp;
    InstallConfig config;
    FakeCommandRunner runner;
    ConfigSessionChecker checker{config, runner};
};

TEST_F(ConfigSessionCheckerTest, IdenticalConfigHasNoChanges)
{
    runner.results.insert("cli-shell-api", FakeCommandRunner::succeed(
        "interfaces {\n    ethernet eth0 {\n        address dhcp\n    }\n}\n\n"));
    EXPECT_FALSE(checker.hasUnsavedChanges());
    ASSERT_NE(runner.find("cli-shell-api"), nullptr);
    EXPECT_EQ(runner.find("cli-shell-api")->args, QStringList({"showConfig", "--show-active-only"}));
}

TEST_F(ConfigSessionCheckerTest, DifferentConfigHasChanges)
{
    runner.results.insert("cli-shell-api", FakeCommandRunner::succeed(
        "interfaces {\n    ethernet eth0 {\n        address 192.0.2.1/24\n    }\n}\n"));
    EXPECT_TRUE(checker.hasUnsavedChanges());
}

TEST_F(ConfigSessionCheckerTest, NoSessionMeansNothingToLose)
{
    runner.results.insert("cli-shell-api", FakeCommandRunner::failWith(1, "not in a config session"));
    EXPECT_FALSE(checker.hasUnsavedChanges());
}

TEST_F(ConfigSessionCheckerTest, UnreadableSavedConfigCountsAsChanged)
{
    QFile::remove(tmp.path() + "/config.boot");
    runner.results.insert("cli-shell-api", FakeCommandRunner::succeed("interfaces {\n}\n"));
    EXPECT_TRUE(checker.hasUnsavedChanges());
}

TEST(config_normalization, drops_comments_and_blank_lines)
{
    EXPECT_EQ(ConfigSessionChecker::normalizeConfig("  a {\n\n// c\n  }\n/* x */\n"), "a {\n}");
}
