#include "bootloader.h"
#include "decisionsource.h"
#include "imagefiles.h"
#include "installconfig.h"
#include "installworkflow.h"
#include "interrupt.h"

#include "fakecommandrunner.h"
#include "fakediskoperations.h"
#include "mocks.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <csignal>
#include <gtest/gtest.h>
#include <memory>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class InstallWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        config.installationDir = tmp.path() + "/installation";
        config.liveMediumDir = tmp.path() + "/live";
        ASSERT_TRUE(QDir().mkpath(config.liveMediumDir));
        write(config.liveMediumDir + "/vmlinuz", "kernel");
        write(config.liveMediumDir + "/initrd.img", "initrd");
        write(config.liveMediumDir + "/filesystem.squashfs", QByteArray(64 * 1024, 's'));

        ON_CALL(inventory, listCandidateDisks())
            .WillByDefault(Return(QList<Disk>{makeDisk("/dev/sda", 22 * InstallConfig::GiB)}));
        ON_CALL(probe, isLiveBoot()).WillByDefault(Return(true));
        ON_CALL(probe, totalMemory()).WillByDefault(Return(8 * InstallConfig::GiB));
        ON_CALL(versions, currentVersion()).WillByDefault(Return(makeVersion("1.4.0", "amd64", "generic")));
        ON_CALL(hasher, hash(_, _)).WillByDefault(Return(QString("$6$rounds=656000$salt$hash")));
    }

    void TearDown() override { clearInterrupt(); }

    void write(const QString &path, const QByteArray &content)
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write(content);
    }

    bool runInstall()
    {
        decisions.reset(new NonInteractiveDecisions(config, presets));
        const Collaborators deps{inventory, disks, grub, hasher, downloader,
                                 versions, probe, unsaved, signatures, *decisions};
        InstallWorkflow workflow(config, deps);
        QObject::connect(&workflow, &InstallWorkflow::warningIssued,
                         [this](const QString &msg) { warnings << msg; });
        QObject::connect(&workflow, &InstallWorkflow::errorOccurred,
                         [this](const QString &msg) { errors << msg; });
        QObject::connect(&workflow, &InstallWorkflow::stateChanged, [this](InstallWorkflow::State s) {
            if (s != interruptAt)
                return;
            if (deliverSignal)
                std::raise(SIGINT);
            else
                requestInterrupt();
        });

        const bool ok = workflow.run();
        failure = workflow.failure();
        finalState = workflow.state();
        plan = workflow.partitionPlan();
        image = workflow.installedImage();
        return ok;
    }

    QTemporaryDir tmp;
    InstallConfig config;
    DecisionPresets presets;
    FakeCommandRunner runner;
    FakeDiskOperations disks;
    GrubBootloader grub{config, runner};
    NiceMock<MockDiskInventory> inventory{config, runner};
    NiceMock<MockPasswordHasher> hasher;
    NiceMock<MockDownloader> downloader;
    NiceMock<MockVersionReader> versions;
    NiceMock<MockSystemProbe> probe;
    NiceMock<MockUnsavedChangesChecker> unsaved;
    NiceMock<MockSignatureVerifier> signatures;
    std::unique_ptr<NonInteractiveDecisions> decisions;

    InstallWorkflow::State interruptAt = InstallWorkflow::Exit;
    bool deliverSignal = false;
    QStringList warnings;
    QStringList errors;
    Failure failure;
    InstallWorkflow::State finalState = InstallWorkflow::Precheck;
    PartitionPlan plan;
    ImageRecord image;
};

TEST_F(InstallWorkflowTest, InstallsOntoTheDisk)
{
    ASSERT_TRUE(runInstall()) << failure.message.toStdString();

    EXPECT_EQ(finalState, InstallWorkflow::Done);
    EXPECT_FALSE(failure.isSet());
    EXPECT_EQ(disks.partitions, QStringList({"/dev/sda1", "/dev/sda2"}));
    EXPECT_EQ(disks.filesystems, QStringList({"/dev/sda1:vfat:EFI", "/dev/sda2:ext4:persistence"}));
    EXPECT_TRUE(disks.everMounted.contains(config.installationDir));
    EXPECT_TRUE(disks.everMounted.contains(config.installationEfi()));
    EXPECT_TRUE(disks.mounted.isEmpty());

    EXPECT_EQ(image.name, "1.4.0");
    EXPECT_TRUE(QFile::exists(image.rootDir + "/vmlinuz"));
    EXPECT_TRUE(QFile::exists(image.rootDir + "/initrd.img"));
    EXPECT_TRUE(QFile::exists(image.rootDir + "/1.4.0.squashfs"));
    EXPECT_TRUE(QFile::exists(configSeedPath(image)));

    EXPECT_NE(runner.find("grub-install"), nullptr);
    EXPECT_EQ(grub.versions(config.installationDir), QStringList({"1.4.0"}));
    EXPECT_EQ(grub.defaultVersion(config.installationDir), "1.4.0");
    EXPECT_TRUE(warnings.contains(config.messages.warnDefaultPassword));
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(InstallWorkflowTest, RefusesInstalledSystem)
{
    ON_CALL(probe, isLiveBoot()).WillByDefault(Return(false));

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Precondition);
    EXPECT_EQ(failure.message, config.messages.errNotLive);
    EXPECT_EQ(errors, QStringList({config.messages.errNotLive}));
    EXPECT_TRUE(disks.partitions.isEmpty());
    EXPECT_EQ(finalState, InstallWorkflow::Exit);
}

TEST_F(InstallWorkflowTest, NoCandidateDiskIsFatal)
{
    ON_CALL(inventory, listCandidateDisks()).WillByDefault(Return(QList<Disk>()));

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Precondition);
    EXPECT_EQ(failure.message, config.messages.errNoDisk);
}

TEST_F(InstallWorkflowTest, LowMemoryIsOnlyAdvisory)
{
    ON_CALL(probe, totalMemory()).WillByDefault(Return(2 * InstallConfig::GiB));

    EXPECT_TRUE(runInstall());
    EXPECT_TRUE(warnings.contains(config.messages.warnLowMemory));
}

TEST_F(InstallWorkflowTest, UndersizedRootRequestUsesAllSpace)
{
    presets.rootSizeGb = 1.0;

    ASSERT_TRUE(runInstall());
    ASSERT_NE(plan.find(PartitionPurpose::Root), nullptr);
    EXPECT_EQ(plan.find(PartitionPurpose::Root)->size, 20 * InstallConfig::GiB);
    EXPECT_TRUE(warnings.contains(config.messages.warnRootSizeInvalid.arg(20.0)));
}

TEST_F(InstallWorkflowTest, TargetDiskIsHonoured)
{
    ON_CALL(inventory, listCandidateDisks())
        .WillByDefault(Return(QList<Disk>{makeDisk("/dev/sda", 22 * InstallConfig::GiB),
                                          makeDisk("/dev/vdb", 30 * InstallConfig::GiB)}));
    presets.targetDisk = "/dev/vdb";

    ASSERT_TRUE(runInstall());
    EXPECT_EQ(disks.partitions, QStringList({"/dev/vdb1", "/dev/vdb2"}));
    EXPECT_EQ(runner.find("grub-install")->args.last(), "/dev/vdb");
}

TEST_F(InstallWorkflowTest, PartitionFailureLeavesNothingMounted)
{
    disks.failPartition = true;

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Resource);
    EXPECT_EQ(failure.message, "partition busy");
    EXPECT_EQ(exitCodeFor(failure), 1);
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(config.installationDir));
}

TEST_F(InstallWorkflowTest, FormatFailureLeavesNothingMounted)
{
    disks.failFilesystem = true;

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Resource);
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_TRUE(disks.everMounted.isEmpty());
}

TEST_F(InstallWorkflowTest, MountFailureUnmountsWhatWasMounted)
{
    disks.failMountTarget = config.installationEfi();

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Resource);
    EXPECT_EQ(disks.everMounted, QStringList({config.installationDir}));
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(config.installationDir));
}

TEST_F(InstallWorkflowTest, InterruptDuringCopyCleansUp)
{
    interruptAt = InstallWorkflow::CopyFiles;

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Interrupt);
    EXPECT_EQ(failure.message, config.messages.infoInterrupted);
    EXPECT_TRUE(errors.isEmpty());
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(config.installationDir));
    EXPECT_EQ(finalState, InstallWorkflow::Exit);
    EXPECT_EQ(exitCodeFor(failure), 0);
}

TEST_F(InstallWorkflowTest, SigintDuringCopyCleansUpAndExitsZero)
{
    InterruptHandler handler;
    interruptAt = InstallWorkflow::CopyFiles;
    deliverSignal = true;

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Interrupt);
    EXPECT_TRUE(errors.isEmpty());
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(config.installationDir));
    EXPECT_EQ(finalState, InstallWorkflow::Exit);
    EXPECT_EQ(exitCodeFor(failure), 0);
}

TEST_F(InstallWorkflowTest, InvalidConsoleTypeFallsBackToKvm)
{
    presets.consoleType = "vga";

    ASSERT_TRUE(runInstall());
    EXPECT_TRUE(warnings.contains(config.messages.warnConsoleTypeInvalid));
    QFile defaults(GrubBootloader::defaultsFile(config.installationDir));
    ASSERT_TRUE(defaults.open(QIODevice::ReadOnly));
    EXPECT_TRUE(defaults.readAll().contains("set console_type=\"kvm\""));
}

TEST_F(InstallWorkflowTest, HashFailureIsFatal)
{
    ON_CALL(hasher, hash(_, _)).WillByDefault(Return(QString()));

    EXPECT_FALSE(runInstall());
    EXPECT_EQ(failure.kind, FailureKind::Resource);
    EXPECT_TRUE(disks.mounted.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(config.installationDir));
}

TEST_F(InstallWorkflowTest, NoSetDefaultKeepsPointerUnset)
{
    presets.setDefault = false;

    ASSERT_TRUE(runInstall());
    EXPECT_TRUE(grub.defaultVersion(config.installationDir).isEmpty());
}

TEST_F(InstallWorkflowTest, SuppliedPasswordIsHashed)
{
    presets.adminPassword = QStringLiteral("Str0ng-pass");
    EXPECT_CALL(hasher, hash(QString("Str0ng-pass"), _)).WillOnce(Return(QString("$6$x")));

    ASSERT_TRUE(runInstall());
    EXPECT_FALSE(warnings.contains(config.messages.warnDefaultPassword));
}
