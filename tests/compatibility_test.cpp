#include "compatibility.h"
#include "installconfig.h"
#include "versionreader.h"

#include "mocks.h"

#include <gtest/gtest.h>

class CompatibilityTest : public ::testing::Test {
protected:
    Messages messages;
    CompatibilityChecker checker{messages};
    VersionInfo current = makeVersion("1.4.0", "amd64", "generic");
};

TEST_F(CompatibilityTest, MatchingImageIsAccepted)
{
    const CompatibilityResult result = checker.check(current, makeVersion("1.4.1", "amd64", "generic"), false);
    EXPECT_TRUE(result.compatible);
    EXPECT_TRUE(result.warnings.isEmpty());
}

TEST_F(CompatibilityTest, ArchitectureMismatchIsFatalEvenWithForce)
{
    const VersionInfo arm = makeVersion("1.4.1", "arm64", "generic");
    for (bool force : {false, true}) {
        const CompatibilityResult result = checker.check(current, arm, force);
        EXPECT_FALSE(result.compatible);
        EXPECT_EQ(result.error, messages.errArchitectureMismatch.arg("amd64", "arm64"));
    }
}

TEST_F(CompatibilityTest, MissingCandidateArchitectureIsFatalEvenWithForce)
{
    const VersionInfo legacy = makeVersion("1.2.9", "", "generic");
    EXPECT_FALSE(checker.check(current, legacy, false).compatible);
    EXPECT_FALSE(checker.check(current, legacy, true).compatible);
    EXPECT_EQ(checker.check(current, legacy, true).error, messages.errMissingArchitecture);
}

TEST_F(CompatibilityTest, FlavorMismatchNeedsForce)
{
    const VersionInfo iso = makeVersion("1.4.1", "amd64", "iso");

    const CompatibilityResult strict = checker.check(current, iso, false);
    EXPECT_FALSE(strict.compatible);
    EXPECT_EQ(strict.error, messages.errFlavorMismatch.arg("generic", "iso"));

    const CompatibilityResult forced = checker.check(current, iso, true);
    EXPECT_TRUE(forced.compatible);
    ASSERT_EQ(forced.warnings.size(), 1);
    EXPECT_EQ(forced.warnings.first(), messages.warnFlavorMismatch.arg("generic", "iso"));
}

TEST_F(CompatibilityTest, MissingCandidateFlavorNeedsForce)
{
    const VersionInfo noFlavor = makeVersion("1.4.1", "amd64", "");
    EXPECT_FALSE(checker.check(current, noFlavor, false).compatible);

    const CompatibilityResult forced = checker.check(current, noFlavor, true);
    EXPECT_TRUE(forced.compatible);
    EXPECT_EQ(forced.warnings.size(), 1);
}

TEST_F(CompatibilityTest, CorruptCurrentImageAlwaysFails)
{
    const VersionInfo broken = makeVersion("1.4.0", "", "generic");
    const VersionInfo noFlavor = makeVersion("1.4.0", "amd64", "");
    const VersionInfo candidate = makeVersion("1.4.1", "amd64", "generic");

    for (bool force : {false, true}) {
        EXPECT_EQ(checker.check(broken, candidate, force).error, messages.errCorruptCurrentImage);
        EXPECT_EQ(checker.check(noFlavor, candidate, force).error, messages.errCorruptCurrentImage);
    }
}
