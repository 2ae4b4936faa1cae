#include "installconfig.h"

#include <QDebug>
#include <QFileInfo>
#include <QSettings>

static void readSize(const QSettings &settings, const QString &key, qint64 &target)
{
    if (!settings.contains(key))
        return;
    bool ok = false;
    const qint64 value = settings.value(key).toLongLong(&ok);
    if (!ok || value <= 0) {
        qWarning() << "Ignoring malformed value for" << key << ":" << settings.value(key).toString();
        return;
    }
    target = value;
}

static void readPath(const QSettings &settings, const QString &key, QString &target)
{
    const QString value = settings.value(key).toString().trimmed();
    if (!value.isEmpty())
        target = value;
}

InstallConfig InstallConfig::load(const QString &path)
{
    InstallConfig config;
    if (path.isEmpty() || !QFileInfo::exists(path))
        return config;

    qDebug() << "Loading configuration from" << path;
    QSettings settings(path, QSettings::IniFormat);

    readSize(settings, "sizes/min_disk_size", config.minDiskSize);
    readSize(settings, "sizes/disk_reserve", config.diskReserve);
    readSize(settings, "sizes/min_root_size", config.minRootSize);
    readSize(settings, "sizes/efi_size", config.efiSize);
    readSize(settings, "sizes/low_memory_threshold", config.lowMemoryThreshold);
    readSize(settings, "sizes/min_free_space_for_add", config.minFreeSpaceForAdd);

    readPath(settings, "paths/iso_mount", config.isoMountDir);
    readPath(settings, "paths/installation", config.installationDir);
    readPath(settings, "paths/live_medium_mount", config.liveMediumMount);
    readPath(settings, "paths/live_medium", config.liveMediumDir);
    readPath(settings, "paths/current_version", config.currentVersionFile);
    readPath(settings, "paths/kernel_cmdline", config.kernelCmdline);
    readPath(settings, "paths/meminfo", config.memInfo);
    readPath(settings, "paths/config_dir", config.configDir);
    readPath(settings, "paths/ssh_dir", config.sshDir);
    readPath(settings, "paths/passwd", config.passwdFile);
    readPath(settings, "paths/signature_key", config.signatureKey);
    readPath(settings, "paths/download", config.downloadPath);

    readPath(settings, "install/default_password", config.defaultPassword);
    readPath(settings, "install/bootloader_id", config.bootloaderId);

    if (settings.status() != QSettings::NoError)
        qWarning() << "Configuration file" << path << "could not be parsed completely";

    return config;
}
