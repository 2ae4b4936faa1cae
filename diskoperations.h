#ifndef DISKOPERATIONS_H
#define DISKOPERATIONS_H

#include "partitionplanner.h"

#include <QString>
#include <QStringList>
#include <QtGlobal>

class CommandRunner;

// Partition table, filesystem and mount primitives. Each call either succeeds
// or returns false with a readable reason in *error.
class DiskOperations {
public:
    virtual ~DiskOperations() = default;

    virtual bool createPartitionTable(const QString &disk, const QString &type, QString *error) = 0;
    // Returns the device node of the new partition, empty on failure.
    virtual QString createPartition(const QString &disk, int number, qint64 size,
                                    PartitionPurpose purpose, const QString &name,
                                    QString *error) = 0;
    virtual bool createFilesystem(const QString &device, const QString &fstype,
                                  const QString &label, QString *error) = 0;
    virtual bool mount(const QString &source, const QString &target, const QString &fstype,
                       const QStringList &options, QString *error) = 0;
    virtual bool unmount(const QString &target, QString *error) = 0;
    virtual bool isMounted(const QString &target) = 0;
    virtual qint64 diskSize(const QString &disk) = 0;
};

class SystemDiskOperations : public DiskOperations {
public:
    explicit SystemDiskOperations(CommandRunner &runner);

    bool createPartitionTable(const QString &disk, const QString &type, QString *error) override;
    QString createPartition(const QString &disk, int number, qint64 size,
                            PartitionPurpose purpose, const QString &name,
                            QString *error) override;
    bool createFilesystem(const QString &device, const QString &fstype,
                          const QString &label, QString *error) override;
    bool mount(const QString &source, const QString &target, const QString &fstype,
               const QStringList &options, QString *error) override;
    bool unmount(const QString &target, QString *error) override;
    bool isMounted(const QString &target) override;
    qint64 diskSize(const QString &disk) override;

private:
    void settle(const QString &disk);

    CommandRunner &runner;
};

// Partition node for a disk and number: sda -> /dev/sda1, nvme0n1 -> /dev/nvme0n1p1.
QString partitionNodeFor(const QString &disk, int number);

#endif // DISKOPERATIONS_H
