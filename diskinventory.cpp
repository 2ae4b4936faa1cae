#include "diskinventory.h"

#include "commandrunner.h"
#include "installconfig.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QVariant>
#include <algorithm>
#include <functional>

static const QString persistenceLabel = QStringLiteral("persistence");

qint64 availableSpace(const InstallConfig &config, const Disk &disk)
{
    return disk.size - config.diskReserve;
}

DiskInventory::DiskInventory(const InstallConfig &config, CommandRunner &runner)
    : config(config), runner(runner) {}

QList<Disk> DiskInventory::parseLsblk(const QByteArray &json)
{
    QList<Disk> disks;

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Failed to parse lsblk output:" << parseError.errorString();
        return disks;
    }

    const QJsonArray devices = doc.object().value(QStringLiteral("blockdevices")).toArray();
    for (const QJsonValue &val : devices) {
        const QJsonObject dev = val.toObject();
        const QString type = dev.value(QStringLiteral("type")).toString();
        const QString name = dev.value(QStringLiteral("name")).toString();
        if (type != QLatin1String("disk") || name.startsWith(QLatin1String("zram")))
            continue;

        Disk disk;
        disk.name = name;
        disk.path = dev.value(QStringLiteral("path")).toString();
        if (disk.path.isEmpty())
            disk.path = QStringLiteral("/dev/") + name;
        disk.size = dev.value(QStringLiteral("size")).toVariant().toLongLong();

        // Partitions, and whatever sits on top of them (crypt, lvm), are
        // walked recursively so a root mounted through a mapper still counts.
        std::function<void(const QJsonObject &)> walk = [&](const QJsonObject &obj) {
            const QString mountpoint = obj.value(QStringLiteral("mountpoint")).toString();
            if (!mountpoint.isEmpty())
                disk.mountpoints.append(mountpoint);

            if (obj.value(QStringLiteral("type")).toString() == QLatin1String("part")) {
                PartitionInfo part;
                part.name = obj.value(QStringLiteral("name")).toString();
                part.path = obj.value(QStringLiteral("path")).toString();
                if (part.path.isEmpty())
                    part.path = QStringLiteral("/dev/") + part.name;
                part.partLabel = obj.value(QStringLiteral("partlabel")).toString();
                part.fsLabel = obj.value(QStringLiteral("label")).toString();
                part.mountpoint = mountpoint;
                part.size = obj.value(QStringLiteral("size")).toVariant().toLongLong();
                disk.partitions.append(part);
            }

            const QJsonArray children = obj.value(QStringLiteral("children")).toArray();
            for (const QJsonValue &child : children) {
                if (child.isObject())
                    walk(child.toObject());
            }
        };

        const QString diskMount = dev.value(QStringLiteral("mountpoint")).toString();
        if (!diskMount.isEmpty())
            disk.mountpoints.append(diskMount);
        const QJsonArray children = dev.value(QStringLiteral("children")).toArray();
        for (const QJsonValue &child : children) {
            if (child.isObject())
                walk(child.toObject());
        }

        disks.append(disk);
    }
    return disks;
}

QList<Disk> DiskInventory::allDisks()
{
    const CommandResult result = runner.run(
        "lsblk", {"-J", "-b", "-o", "NAME,PATH,TYPE,SIZE,PKNAME,PARTLABEL,LABEL,MOUNTPOINT"});
    if (!result.ok()) {
        qWarning().noquote() << describeFailure("lsblk", result);
        return {};
    }
    return parseLsblk(result.stdOut.toUtf8());
}

bool DiskInventory::hostsRunningSystem(const Disk &disk) const
{
    return disk.mountpoints.contains(QStringLiteral("/"))
           || disk.mountpoints.contains(config.liveMediumMount);
}

QList<Disk> DiskInventory::listCandidateDisks()
{
    QList<Disk> candidates;
    for (const Disk &disk : allDisks()) {
        if (disk.size < config.minDiskSize) {
            qDebug() << "Skipping" << disk.path << "- too small:" << disk.size;
            continue;
        }
        if (hostsRunningSystem(disk)) {
            qDebug() << "Skipping" << disk.path << "- hosts the running system";
            continue;
        }
        candidates.append(disk);
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Disk &a, const Disk &b) { return a.path < b.path; });
    return candidates;
}

std::optional<Disk> DiskInventory::findPersistenceDisk()
{
    for (const Disk &disk : allDisks()) {
        for (const PartitionInfo &part : disk.partitions) {
            if (part.partLabel == persistenceLabel || part.fsLabel == persistenceLabel)
                return disk;
        }
    }
    return std::nullopt;
}

QString DiskInventory::persistenceRoot()
{
    const std::optional<Disk> disk = findPersistenceDisk();
    if (disk) {
        for (const PartitionInfo &part : disk->partitions) {
            if ((part.partLabel == persistenceLabel || part.fsLabel == persistenceLabel)
                && !part.mountpoint.isEmpty())
                return part.mountpoint;
        }
    }
    return QStringLiteral("/");
}
