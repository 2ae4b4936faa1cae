#include "partitionplanner.h"

#include "diskinventory.h"
#include "installconfig.h"

#include <QDebug>
#include <cmath>
#include <limits>

qint64 PartitionPlan::totalSize() const
{
    qint64 sum = 0;
    for (const PlannedPartition &p : partitions)
        sum += p.size;
    return sum;
}

const PlannedPartition *PartitionPlan::find(PartitionPurpose purpose) const
{
    for (const PlannedPartition &p : partitions) {
        if (p.purpose == purpose)
            return &p;
    }
    return nullptr;
}

// Saturates instead of overflowing; NaN and negative sizes become 0. Either
// end is then out of range for resolveRootSize.
qint64 gibToBytes(double gib)
{
    const double bytes = gib * static_cast<double>(InstallConfig::GiB);
    if (std::isnan(bytes) || bytes <= 0)
        return 0;
    // 2^63 is exactly representable; anything at or above it does not fit.
    if (bytes >= 9223372036854775808.0)
        return std::numeric_limits<qint64>::max();
    return static_cast<qint64>(bytes);
}

// Rounded to one decimal, the way sizes are shown to the operator.
double bytesToGib(qint64 bytes)
{
    return std::round(static_cast<double>(bytes) / InstallConfig::GiB * 10.0) / 10.0;
}

qint64 resolveRootSize(const InstallConfig &config,
                       qint64 availableSpace,
                       std::optional<qint64> requestedBytes,
                       QString *advisory)
{
    if (!requestedBytes)
        return availableSpace;

    const qint64 requested = *requestedBytes;
    if (requested < config.minRootSize || requested > availableSpace) {
        if (advisory)
            *advisory = config.messages.warnRootSizeInvalid.arg(bytesToGib(availableSpace));
        return availableSpace;
    }
    return requested;
}

PartitionPlan planPartitions(const InstallConfig &config,
                             const Disk &disk,
                             std::optional<qint64> requestedRootSizeBytes)
{
    PartitionPlan plan;
    plan.disk = disk.path;

    const qint64 available = availableSpace(config, disk);
    QString advisory;
    const qint64 rootSize = resolveRootSize(config, available, requestedRootSizeBytes, &advisory);
    if (!advisory.isEmpty())
        plan.advisories << advisory;

    PlannedPartition efi;
    efi.purpose = PartitionPurpose::Efi;
    efi.size = config.efiSize;
    efi.filesystem = QStringLiteral("vfat");
    efi.name = QStringLiteral("EFI");
    plan.partitions << efi;

    PlannedPartition root;
    root.purpose = PartitionPurpose::Root;
    root.size = rootSize;
    root.filesystem = QStringLiteral("ext4");
    root.name = QStringLiteral("persistence");
    plan.partitions << root;

    qDebug() << "Partition plan for" << disk.path << ": efi" << efi.size << "root" << root.size;
    return plan;
}
