#ifndef PARTITIONPLANNER_H
#define PARTITIONPLANNER_H

#include <QList>
#include <QString>
#include <QtGlobal>
#include <optional>

class InstallConfig;
struct Disk;

enum class PartitionPurpose {
    Efi,
    Root
};

struct PlannedPartition {
    PartitionPurpose purpose = PartitionPurpose::Root;
    qint64 size = 0;
    QString filesystem;
    QString name;   // GPT partition name, also used as filesystem label
};

struct PartitionPlan {
    QString disk;
    QList<PlannedPartition> partitions;   // in on-disk order
    QStringList advisories;

    qint64 totalSize() const;
    const PlannedPartition *find(PartitionPurpose purpose) const;
};

// Resolves the requested root size against [minRootSize, available]. Anything
// outside the range means "use all available space" and adds an advisory.
qint64 resolveRootSize(const InstallConfig &config,
                       qint64 availableSpace,
                       std::optional<qint64> requestedBytes,
                       QString *advisory = nullptr);

// EFI (vfat, fixed size) followed by ROOT (ext4). Never fails on sizing.
PartitionPlan planPartitions(const InstallConfig &config,
                             const Disk &disk,
                             std::optional<qint64> requestedRootSizeBytes);

qint64 gibToBytes(double gib);
double bytesToGib(qint64 bytes);

#endif // PARTITIONPLANNER_H
