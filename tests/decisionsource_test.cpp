#include "decisionsource.h"
#include "installconfig.h"
#include "interrupt.h"
#include "partitionplanner.h"

#include "mocks.h"

#include <QTextStream>
#include <gtest/gtest.h>
#include <memory>

class NonInteractiveDecisionsTest : public ::testing::Test {
protected:
    NonInteractiveDecisions make()
    {
        NonInteractiveDecisions decisions(config, presets);
        decisions.setAdvisoryHandler([this](const QString &msg) { advisories << msg; });
        return decisions;
    }

    InstallConfig config;
    DecisionPresets presets;
    QStringList advisories;
    QList<Disk> candidates{makeDisk("/dev/sda", 20 * InstallConfig::GiB),
                           makeDisk("/dev/sdb", 40 * InstallConfig::GiB)};
};

TEST_F(NonInteractiveDecisionsTest, TargetDiskWhenItIsACandidate)
{
    presets.targetDisk = "/dev/sdb";
    EXPECT_EQ(make().selectDisk(candidates), "/dev/sdb");
}

TEST_F(NonInteractiveDecisionsTest, FirstCandidateOtherwise)
{
    presets.targetDisk = "/dev/sdz";
    EXPECT_EQ(make().selectDisk(candidates), "/dev/sda");
    presets.targetDisk.clear();
    EXPECT_EQ(make().selectDisk(candidates), "/dev/sda");
}

TEST_F(NonInteractiveDecisionsTest, ConfirmsAndMigrates)
{
    NonInteractiveDecisions decisions = make();
    EXPECT_TRUE(decisions.confirmDestructive("wipe?"));
    EXPECT_TRUE(decisions.migrateData());
    EXPECT_TRUE(decisions.acceptUnsavedChanges());
    EXPECT_TRUE(decisions.setAsDefault());
}

TEST_F(NonInteractiveDecisionsTest, DefaultPasswordComesWithAdvisory)
{
    EXPECT_EQ(make().adminPassword(), config.defaultPassword);
    EXPECT_EQ(advisories, QStringList({config.messages.warnDefaultPassword}));
}

TEST_F(NonInteractiveDecisionsTest, WeakPasswordIsOnlyAdvisory)
{
    presets.adminPassword = QStringLiteral("short");
    EXPECT_EQ(make().adminPassword(), "short");
    presets.adminPassword = QStringLiteral("alllowercase");
    EXPECT_EQ(make().adminPassword(), "alllowercase");
    EXPECT_EQ(advisories, QStringList({config.messages.warnPasswordShort, config.messages.warnPasswordWeak}));
}

TEST_F(NonInteractiveDecisionsTest, RootSizeFromPreset)
{
    EXPECT_FALSE(make().rootSize(10 * InstallConfig::GiB).has_value());
    presets.rootSizeGb = 1.0;
    EXPECT_EQ(make().rootSize(10 * InstallConfig::GiB), std::optional<qint64>(InstallConfig::GiB));
}

TEST_F(NonInteractiveDecisionsTest, InvalidImageNameFallsBackToSuggestion)
{
    presets.imageName = "bad name!";
    EXPECT_EQ(make().imageName("1.4.0"), "1.4.0");
    EXPECT_EQ(advisories.size(), 1);

    presets.imageName = "custom_name";
    EXPECT_EQ(make().imageName("1.4.0"), "custom_name");
}

TEST_F(NonInteractiveDecisionsTest, NoSetDefaultIsHonoured)
{
    presets.setDefault = false;
    EXPECT_FALSE(make().setAsDefault());
}

class ConsolePrompterTest : public ::testing::Test {
protected:
    // Each prompter gets a fresh input stream over `answers`.
    ConsolePrompter prompter(const QString &answers)
    {
        input = answers;
        in.reset(new QTextStream(&input, QIODevice::ReadOnly));
        return ConsolePrompter(config, presets, *in, out);
    }

    QString written()
    {
        out.flush();
        return output;
    }

    InstallConfig config;
    DecisionPresets presets;
    QString input;
    QString output;
    std::unique_ptr<QTextStream> in;
    QTextStream out{&output, QIODevice::WriteOnly};
};

TEST_F(ConsolePrompterTest, RepromptsForRootSizeOutOfRange)
{
    ConsolePrompter p = prompter("n\n1\n99\n4\n");
    EXPECT_EQ(p.rootSize(20 * InstallConfig::GiB), std::optional<qint64>(4 * InstallConfig::GiB));
    EXPECT_TRUE(written().contains(config.messages.warnRootSizeTooSmall));
    EXPECT_TRUE(written().contains(config.messages.warnRootSizeTooBig));
}

TEST_F(ConsolePrompterTest, AllSpaceByDefault)
{
    ConsolePrompter p = prompter("\n");
    EXPECT_FALSE(p.rootSize(20 * InstallConfig::GiB).has_value());
}

TEST_F(ConsolePrompterTest, EnforcesPasswordStrengthAndConfirmation)
{
    ConsolePrompter p = prompter("short\nalllowercase\nGood-pass1\nmismatch\nGood-pass1\nGood-pass1\n");
    EXPECT_EQ(p.adminPassword(), "Good-pass1");
    EXPECT_TRUE(written().contains(config.messages.warnPasswordShort));
    EXPECT_TRUE(written().contains(config.messages.warnPasswordWeak));
    EXPECT_TRUE(written().contains("did not match"));
}

TEST_F(ConsolePrompterTest, RepromptsForInvalidImageName)
{
    ConsolePrompter p = prompter("bad name\nmy_image\n");
    EXPECT_EQ(p.imageName("1.4.0"), "my_image");
    EXPECT_TRUE(written().contains(config.messages.warnImageNameWrong));
}

TEST_F(ConsolePrompterTest, EmptyAnswerKeepsSuggestedName)
{
    ConsolePrompter p = prompter("\n");
    EXPECT_EQ(p.imageName("1.4.0"), "1.4.0");
}

TEST_F(ConsolePrompterTest, DiskByNameOrPath)
{
    const QList<Disk> disks{makeDisk("/dev/sda", 20 * InstallConfig::GiB),
                            makeDisk("/dev/sdb", 40 * InstallConfig::GiB)};
    ConsolePrompter p = prompter("sdc\nsdb\n");
    EXPECT_EQ(p.selectDisk(disks), "/dev/sdb");
    EXPECT_TRUE(written().contains("Unknown disk: sdc"));
}

TEST_F(ConsolePrompterTest, DestructiveConfirmationDefaultsToNo)
{
    EXPECT_FALSE(prompter("\n").confirmDestructive("Erase?"));
    EXPECT_TRUE(prompter("yes\n").confirmDestructive("Erase?"));
}

TEST_F(ConsolePrompterTest, UnsavedChangesAreNeverAccepted)
{
    EXPECT_FALSE(prompter("").acceptUnsavedChanges());
}

TEST_F(ConsolePrompterTest, ConsoleTypeLetters)
{
    EXPECT_EQ(prompter("s\n").consoleType(), "serial");
    EXPECT_EQ(prompter("\n").consoleType(), "kvm");
}

TEST_F(ConsolePrompterTest, ClosedInputStopsImageNameQuestion)
{
    presets.imageName = "bad name";
    ConsolePrompter p = prompter("");
    EXPECT_EQ(p.imageName("1.4.0"), "1.4.0");
    EXPECT_TRUE(p.aborted());
    EXPECT_EQ(written().count(config.messages.warnImageNameWrong), 1);
}

TEST_F(ConsolePrompterTest, ClosedInputStopsRootSizeQuestion)
{
    ConsolePrompter p = prompter("n\n");
    EXPECT_FALSE(p.rootSize(20 * InstallConfig::GiB).has_value());
    EXPECT_TRUE(p.aborted());
}

TEST_F(ConsolePrompterTest, ClosedInputStopsPasswordQuestion)
{
    ConsolePrompter p = prompter("");
    EXPECT_TRUE(p.adminPassword().isEmpty());
    EXPECT_TRUE(p.aborted());
}

TEST_F(ConsolePrompterTest, ClosedInputStopsDiskQuestion)
{
    presets.targetDisk = "/dev/sdz";
    ConsolePrompter p = prompter("");
    EXPECT_TRUE(p.selectDisk({makeDisk("/dev/sda", 20 * InstallConfig::GiB)}).isEmpty());
    EXPECT_TRUE(p.aborted());
}

TEST_F(ConsolePrompterTest, InterruptStopsRepeatedQuestion)
{
    requestInterrupt();
    ConsolePrompter p = prompter("bad name\nbad name\nbad name\n");
    p.imageName("1.4.0");
    clearInterrupt();
    EXPECT_TRUE(p.aborted());
    EXPECT_EQ(written().count(config.messages.warnImageNameWrong), 1);
}

TEST_F(ConsolePrompterTest, AnsweredQuestionsDoNotAbort)
{
    ConsolePrompter p = prompter("my_image\n");
    EXPECT_EQ(p.imageName("1.4.0"), "my_image");
    EXPECT_FALSE(p.aborted());
}
