#ifndef INSTALLCONFIG_H
#define INSTALLCONFIG_H

#include <QString>
#include <QtGlobal>

// User-visible texts. Kept together so the workflows never hardcode wording.
struct Messages {
    QString errNotLive = QStringLiteral("The system is already installed. Please use \"add system image\" instead.");
    QString errLive = QStringLiteral("The system is in live-boot mode. Please use \"install image\" instead.");
    QString errNotEnoughSpace = QStringLiteral("Image upgrade requires at least 2GB of free drive space.");
    QString errUnsavedCommits = QStringLiteral("There are unsaved changes to the configuration. Either save or revert before upgrade.");
    QString errNoDisk = QStringLiteral("No suitable disk was found. There must be at least one disk of 2GB or greater size.");
    QString errImproperImage = QStringLiteral("Missing sha256sum.txt.\nEither this image is corrupted, or of era 1.2.x (md5sum) and would downgrade image tools;\ndisallowed in either case.");
    QString errIncompatibleImage = QStringLiteral("Image compatibility check failed, aborting installation.");
    QString errArchitectureMismatch = QStringLiteral("The current architecture is \"%1\", the new image is for \"%2\". Upgrading to a different image architecture will break your system.");
    QString errFlavorMismatch = QStringLiteral("The current image flavor is \"%1\", the new image is \"%2\". Upgrading to a non-matching flavor can have unpredictable consequences.");
    QString errMissingArchitecture = QStringLiteral("The new image version data does not specify architecture, cannot check compatibility (is it a legacy release image?)");
    QString errMissingFlavor = QStringLiteral("The new image version data does not specify flavor, cannot check compatibility (is it a legacy release image?)");
    QString errCorruptCurrentImage = QStringLiteral("Version data in the current image is malformed: missing flavor and/or architecture fields. Upgrade compatibility cannot be checked.");
    QString errUnsupportedSignature = QStringLiteral("Unsupported signature type, signature cannot be verified.");
    QString errNoAnswer = QStringLiteral("No answer was given, aborting.");
    QString errDiskDeclined = QStringLiteral("Installation aborted: the disk was not confirmed.");
    QString infoInstallWelcome = QStringLiteral("Welcome to VyOS installation!\nThis command will install VyOS to your permanent storage.");
    QString infoInstalling = QStringLiteral("Installing VyOS image...");
    QString infoInstallSuccess = QStringLiteral("The image installed successfully; please reboot now.");
    QString infoPartitioning = QStringLiteral("Creating partition table...");
    QString infoDiskConfirm = QStringLiteral("Installation will delete all data on the drive. Continue?");
    QString infoAddSuccess = QStringLiteral("Image %1 installed successfully");
    QString infoDownloading = QStringLiteral("Downloading image from %1");
    QString infoInterrupted = QStringLiteral("Stopped by Ctrl+C");
    QString warnSignatureInvalid = QStringLiteral("Signature is not valid.");
    QString warnSignatureUnavailable = QStringLiteral("Signature is not available.");
    QString warnRootSizeTooBig = QStringLiteral("The size is too big. Try again.");
    QString warnRootSizeTooSmall = QStringLiteral("The size is too small. Try again.");
    QString warnRootSizeInvalid = QStringLiteral("Invalid root size, using all available space: %1 GB");
    QString warnImageNameWrong = QStringLiteral("The suggested name is unsupported!\nIt must be between 1 and 64 characters long and can contain only alphanumeric characters, hyphens, and underscores.");
    QString warnPasswordShort = QStringLiteral("Password must be at least 8 characters long");
    QString warnPasswordWeak = QStringLiteral("Password is weak - recommended to use strong password.");
    QString warnDefaultPassword = QStringLiteral("No password was supplied, the default password is used. Change it after the first login.");
    QString warnFlavorMismatch = QStringLiteral("The current image flavor is \"%1\", the new image is \"%2\". Proceeding anyway because --force option was specified.");
    QString warnMissingFlavorForced = QStringLiteral("The new image version data does not specify flavor. Proceeding anyway because --force option was specified.");
    QString warnConsoleTypeInvalid = QStringLiteral("Invalid console type. Using default KVM console.");
    QString warnLowMemory = QStringLiteral("Your system has less than 4GB of RAM, installation may fail if you continue. Please consider closing other programs to free up memory.");
};

// Immutable settings shared by every module. Built once in main() and passed by
// const reference from there on.
class InstallConfig {
public:
    static constexpr qint64 MiB = 1024LL * 1024;
    static constexpr qint64 GiB = 1024LL * MiB;

    qint64 minDiskSize = 2 * GiB;
    qint64 diskReserve = 2 * GiB;
    qint64 minRootSize = 1536 * MiB;
    qint64 efiSize = 512 * MiB;
    qint64 lowMemoryThreshold = 4 * GiB;
    qint64 minFreeSpaceForAdd = 2 * GiB;

    QString isoMountDir = QStringLiteral("/mnt/iso");
    QString installationDir = QStringLiteral("/mnt/installation");
    QString liveMediumMount = QStringLiteral("/run/live/medium");
    QString liveMediumDir = QStringLiteral("/run/live/medium/live");
    QString currentVersionFile = QStringLiteral("/usr/share/vyos/version.json");
    QString kernelCmdline = QStringLiteral("/proc/cmdline");
    QString memInfo = QStringLiteral("/proc/meminfo");
    QString configDir = QStringLiteral("/opt/vyatta/etc/config");
    QString sshDir = QStringLiteral("/etc/ssh");
    QString passwdFile = QStringLiteral("/etc/passwd");
    QString signatureKey = QStringLiteral("/usr/share/vyos/keys/vyos-release.minisign.pub");
    QString downloadPath = QStringLiteral("/tmp/vyos_image.iso");

    QString defaultPassword = QStringLiteral("vyos");
    QString bootloaderId = QStringLiteral("VyOS");

    Messages messages;

    // Reads overrides from an INI file. A missing file yields the defaults.
    static InstallConfig load(const QString &path);

    // Derived locations inside the installation root.
    QString installationBoot() const { return installationDir + QStringLiteral("/boot"); }
    QString installationEfi() const { return installationDir + QStringLiteral("/boot/efi"); }
    QString isoLiveDir() const { return isoMountDir + QStringLiteral("/live"); }
};

#endif // INSTALLCONFIG_H
