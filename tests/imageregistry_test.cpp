#include "bootloader.h"
#include "imageregistry.h"
#include "installconfig.h"

#include "fakecommandrunner.h"
#include "mocks.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class ImageRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(tmp.isValid()); }

    void addImage(const QString &name)
    {
        ImageRecord record;
        QString error;
        ASSERT_TRUE(registry.createRecord(name, makeVersion(name, "amd64", "generic"), &record, &error))
            << error.toStdString();
        ASSERT_TRUE(registry.registerImage(record, false, &error)) << error.toStdString();
    }

    InstallConfig config;
    FakeCommandRunner runner;
    GrubBootloader grub{config, runner};
    QTemporaryDir tmp;
    ImageRegistry registry{grub, tmp.path()};
};

TEST_F(ImageRegistryTest, FreeNameIsKept)
{
    EXPECT_EQ(registry.resolveName("vyos-1.4"), "vyos-1.4");
}

TEST_F(ImageRegistryTest, SingleCollisionGetsFirstSuffix)
{
    addImage("vyos-1.4");
    EXPECT_EQ(registry.resolveName("vyos-1.4"), "vyos-1.4.1");
}

TEST_F(ImageRegistryTest, NCollisionsGetSuffixN)
{
    addImage("foo");
    for (int i = 1; i < 4; ++i)
        addImage(QString("foo.%1").arg(i));
    EXPECT_EQ(registry.resolveName("foo"), "foo.4");
}

TEST_F(ImageRegistryTest, LowestFreeSuffixIsUsed)
{
    addImage("foo");
    addImage("foo.2");
    EXPECT_EQ(registry.resolveName("foo"), "foo.1");
}

TEST_F(ImageRegistryTest, UnregisteredDirectoryStillTakesTheName)
{
    ASSERT_TRUE(QDir().mkpath(tmp.path() + "/boot/leftover/rw"));
    EXPECT_TRUE(registry.installedImages().contains("leftover"));
    EXPECT_EQ(registry.resolveName("leftover"), "leftover.1");
}

TEST_F(ImageRegistryTest, CreateRecordBuildsOverlay)
{
    ImageRecord record;
    QString error;
    ASSERT_TRUE(registry.createRecord("1.4.0", makeVersion("1.4.0", "amd64", "generic"), &record, &error));
    EXPECT_EQ(record.rootDir, tmp.path() + "/boot/1.4.0");
    EXPECT_TRUE(QFileInfo(record.overlayDir).isDir());

    ImageRecord again;
    EXPECT_FALSE(registry.createRecord("1.4.0", record.version, &again, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(ImageRegistryTest, RegisterCanMoveDefaultPointer)
{
    addImage("1.4.0");
    EXPECT_TRUE(registry.defaultImage().isEmpty());

    ImageRecord record;
    QString error;
    ASSERT_TRUE(registry.createRecord("1.5.0", makeVersion("1.5.0", "amd64", "generic"), &record, &error));
    ASSERT_TRUE(registry.registerImage(record, true, &error));
    EXPECT_EQ(registry.defaultImage(), "1.5.0");
    EXPECT_EQ(registry.installedImages(), QStringList({"1.4.0", "1.5.0"}));
}

TEST_F(ImageRegistryTest, FailedDefaultTakesTheEntryOutAgain)
{
    ::testing::NiceMock<MockBootloaderIntegrator> bootloader;
    ImageRegistry failing(bootloader, tmp.path());
    ImageRecord record;
    QString error;
    ASSERT_TRUE(failing.createRecord("1.5.0", makeVersion("1.5.0", "amd64", "generic"), &record, &error));

    ON_CALL(bootloader, addVersion(::testing::_, ::testing::_, ::testing::_)).WillByDefault(::testing::Return(true));
    EXPECT_CALL(bootloader, setDefault(tmp.path(), QString("1.5.0"), ::testing::_))
        .WillOnce(::testing::Invoke([](const QString &, const QString &, QString *err) {
            *err = "Cannot write defaults";
            return false;
        }));
    EXPECT_CALL(bootloader, removeVersion(tmp.path(), QString("1.5.0"), ::testing::_))
        .WillOnce(::testing::Return(true));

    EXPECT_FALSE(failing.registerImage(record, true, &error));
    EXPECT_EQ(error, "Cannot write defaults");
}

TEST_F(ImageRegistryTest, EntryStaysWhenDefaultIsLeftAlone)
{
    ::testing::NiceMock<MockBootloaderIntegrator> bootloader;
    ImageRegistry registryWithMock(bootloader, tmp.path());
    ImageRecord record;
    record.name = "1.5.0";
    QString error;

    ON_CALL(bootloader, addVersion(::testing::_, ::testing::_, ::testing::_)).WillByDefault(::testing::Return(true));
    EXPECT_CALL(bootloader, setDefault(::testing::_, ::testing::_, ::testing::_)).Times(0);
    EXPECT_CALL(bootloader, removeVersion(::testing::_, ::testing::_, ::testing::_)).Times(0);

    EXPECT_TRUE(registryWithMock.registerImage(record, false, &error));
}

TEST(image_names, validation)
{
    EXPECT_TRUE(isValidImageName("vyos_1-4"));
    EXPECT_TRUE(isValidImageName(QString(64, 'a')));
    EXPECT_FALSE(isValidImageName(QString(65, 'a')));
    EXPECT_FALSE(isValidImageName(""));
    EXPECT_FALSE(isValidImageName("1.4.0"));
    EXPECT_FALSE(isValidImageName("has space"));
    EXPECT_FALSE(isValidImageName("../etc"));
}

TEST(image_names, derived_from_version)
{
    EXPECT_EQ(defaultImageName("1.4.0-rc1"), "1.4.0-rc1");
    EXPECT_EQ(defaultImageName("1.5 beta/2"), "1.5_beta_2");
    EXPECT_EQ(defaultImageName(""), "unknown");
    EXPECT_EQ(defaultImageName(QString(80, 'x')).size(), 64);
}
