#ifndef DISKINVENTORY_H
#define DISKINVENTORY_H

#include <QList>
#include <QStringList>
#include <QString>
#include <QtGlobal>
#include <optional>

class CommandRunner;
class InstallConfig;

struct PartitionInfo {
    QString name;
    QString path;
    QString partLabel;
    QString fsLabel;
    QString mountpoint;
    qint64 size = 0;
};

struct Disk {
    QString name;
    QString path;
    qint64 size = 0;
    QList<PartitionInfo> partitions;
    QStringList mountpoints;   // of the disk and everything stacked on it
};

// Disk size minus the fixed reserve kept for GPT, alignment and metadata.
qint64 availableSpace(const InstallConfig &config, const Disk &disk);

// Queried fresh from lsblk on every call; nothing is cached.
class DiskInventory {
public:
    DiskInventory(const InstallConfig &config, CommandRunner &runner);
    virtual ~DiskInventory() = default;

    // Every block device of type "disk", in lsblk order. Empty on failure.
    QList<Disk> allDisks();

    // Disks large enough for an installation that do not host the running
    // root or the live medium, ordered by path.
    virtual QList<Disk> listCandidateDisks();

    virtual std::optional<Disk> findPersistenceDisk();

    // Where the persistence partition is mounted, or "/" if there is none.
    virtual QString persistenceRoot();

    // Parses `lsblk -J` output; exposed for tests.
    static QList<Disk> parseLsblk(const QByteArray &json);

private:
    bool hostsRunningSystem(const Disk &disk) const;

    const InstallConfig &config;
    CommandRunner &runner;
};

#endif // DISKINVENTORY_H
