#include "diskoperations.h"

#include "commandrunner.h"

#include <QDebug>

static QString baseNameOf(const QString &devPath)
{
    return devPath.startsWith("/dev/") ? devPath.mid(5) : devPath;
}

QString partitionNodeFor(const QString &disk, int number)
{
    const QString baseName = baseNameOf(disk);
    if (!baseName.isEmpty() && baseName.back().isDigit())
        return "/dev/" + baseName + "p" + QString::number(number);
    return "/dev/" + baseName + QString::number(number);
}

static bool fail(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return false;
}

SystemDiskOperations::SystemDiskOperations(CommandRunner &runner) : runner(runner) {}

// Let the kernel and udev catch up with a changed partition table.
void SystemDiskOperations::settle(const QString &disk)
{
    const CommandResult probe = runner.run("partprobe", {disk});
    if (!probe.ok())
        qDebug().noquote() << describeFailure("partprobe", probe);
    const CommandResult udev = runner.run("udevadm", {"settle"});
    if (!udev.ok())
        qDebug().noquote() << describeFailure("udevadm", udev);
}

bool SystemDiskOperations::createPartitionTable(const QString &disk, const QString &type, QString *error)
{
    // Wipe signatures first so a stale iso-hybrid or RAID superblock can't
    // resurrect the old layout.
    CommandResult result = runner.run("wipefs", {"--all", "--force", disk});
    if (!result.ok())
        return fail(error, "Failed to wipe " + disk + ": " + describeFailure("wipefs", result));

    result = runner.run("parted", {"--script", disk, "mklabel", type});
    if (!result.ok())
        return fail(error, "Failed to create " + type.toUpper() + " partition table on " + disk
                               + ": " + describeFailure("parted", result));
    settle(disk);
    return true;
}

QString SystemDiskOperations::createPartition(const QString &disk, int number, qint64 size,
                                              PartitionPurpose purpose, const QString &name,
                                              QString *error)
{
    const QString num = QString::number(number);
    const QString typeCode = purpose == PartitionPurpose::Efi ? "EF00" : "8300";
    // sgdisk aligns the start itself; the end is given as a size in KiB.
    const QString extent = QString("%1:0:+%2K").arg(num).arg(size / 1024);

    const CommandResult result = runner.run("sgdisk", {"--new=" + extent,
                                                       "--typecode=" + num + ":" + typeCode,
                                                       "--change-name=" + num + ":" + name,
                                                       disk});
    if (!result.ok()) {
        fail(error, QString("Failed to create partition %1 on %2: %3")
                        .arg(num, disk, describeFailure("sgdisk", result)));
        return QString();
    }
    settle(disk);
    return partitionNodeFor(disk, number);
}

bool SystemDiskOperations::createFilesystem(const QString &device, const QString &fstype,
                                            const QString &label, QString *error)
{
    QString program;
    QStringList args;
    if (fstype == "vfat") {
        program = "mkfs.fat";
        args << "-F32";
        if (!label.isEmpty())
            args << "-n" << label.left(11).toUpper();
    } else if (fstype == "ext4") {
        program = "mkfs.ext4";
        args << "-F" << "-q";
        if (!label.isEmpty())
            args << "-L" << label;
    } else {
        return fail(error, "Unsupported filesystem type: " + fstype);
    }
    args << device;

    const CommandResult result = runner.run(program, args);
    if (!result.ok())
        return fail(error, "Failed to format " + device + ": " + describeFailure(program, result));
    return true;
}

bool SystemDiskOperations::mount(const QString &source, const QString &target, const QString &fstype,
                                 const QStringList &options, QString *error)
{
    QStringList args;
    if (!fstype.isEmpty())
        args << "-t" << fstype;
    if (!options.isEmpty())
        args << "-o" << options.join(',');
    args << source << target;

    const CommandResult result = runner.run("mount", args);
    if (!result.ok())
        return fail(error, QString("Failed to mount %1 at %2: %3")
                               .arg(source, target, describeFailure("mount", result)));
    return true;
}

bool SystemDiskOperations::unmount(const QString &target, QString *error)
{
    const CommandResult result = runner.run("umount", {target});
    if (!result.ok())
        return fail(error, "Failed to unmount " + target + ": " + describeFailure("umount", result));
    return true;
}

bool SystemDiskOperations::isMounted(const QString &target)
{
    return runner.run("findmnt", {"-rn", target}).ok();
}

qint64 SystemDiskOperations::diskSize(const QString &disk)
{
    const CommandResult result = runner.run("lsblk", {"-bdno", "SIZE", disk});
    if (!result.ok()) {
        qWarning().noquote() << describeFailure("lsblk", result);
        return 0;
    }
    return result.stdOut.trimmed().toLongLong();
}
