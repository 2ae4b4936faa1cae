#include "installworkflow.h"

#include "bootloader.h"
#include "cleanupcoordinator.h"
#include "decisionsource.h"
#include "diskoperations.h"
#include "imagefiles.h"
#include "imageregistry.h"
#include "installconfig.h"
#include "interrupt.h"
#include "passwordhasher.h"
#include "systemprobe.h"
#include "versionreader.h"

#include <QDebug>
#include <QDir>
#include <algorithm>
#include <unistd.h>

InstallWorkflow::InstallWorkflow(const InstallConfig &config, const Collaborators &deps, QObject *parent)
    : QObject(parent), config(config), deps(deps) {}

void InstallWorkflow::setState(State state)
{
    current = state;
    qDebug() << "Install state:" << state;
    emit stateChanged(state);
}

bool InstallWorkflow::fail(FailureKind kind, const QString &message)
{
    lastFailure.kind = kind;
    lastFailure.message = message;
    return false;
}

bool InstallWorkflow::run()
{
    struct Step {
        State state;
        bool (InstallWorkflow::*action)();
    };
    static const Step steps[] = {
        {Precheck, &InstallWorkflow::precheck},
        {DiskSelect, &InstallWorkflow::selectDisk},
        {Confirm, &InstallWorkflow::confirm},
        {Partition, &InstallWorkflow::partition},
        {Format, &InstallWorkflow::format},
        {Mount, &InstallWorkflow::mount},
        {CopyFiles, &InstallWorkflow::copyFiles},
        {ConfigureBoot, &InstallWorkflow::configureBoot},
        {CreateUser, &InstallWorkflow::createUser},
        {Finalize, &InstallWorkflow::finalize},
    };

    lastFailure = Failure();
    deps.decisions.setAdvisoryHandler([this](const QString &message) { emit warningIssued(message); });

    CleanupCoordinator scope(deps.disks);
    cleanup = &scope;

    bool ok = true;
    for (const Step &step : steps) {
        if (interruptRequested()) {
            ok = fail(FailureKind::Interrupt, config.messages.infoInterrupted);
            break;
        }
        setState(step.state);
        const bool stepOk = (this->*step.action)();
        // An unanswered question overrides whatever the step made of it.
        if (deps.decisions.aborted())
            ok = fail(FailureKind::Precondition, config.messages.errNoAnswer);
        else
            ok = stepOk;
        if (!ok)
            break;
    }
    // A step may have noticed the interrupt on its own (e.g. mid-copy).
    if (!ok && lastFailure.kind != FailureKind::Interrupt && interruptRequested())
        fail(FailureKind::Interrupt, config.messages.infoInterrupted);

    if (!ok) {
        setState(Failed);
        if (lastFailure.kind != FailureKind::Interrupt)
            emit errorOccurred(lastFailure.message);
        setState(Cleanup);
        scope.run();
        cleanup = nullptr;
        setState(Exit);
        emit finished();
        return false;
    }

    scope.run();
    cleanup = nullptr;
    setState(Done);
    emit logMessage(config.messages.infoInstallSuccess);
    emit finished();
    return true;
}

bool InstallWorkflow::precheck()
{
    if (!deps.probe.isLiveBoot())
        return fail(FailureKind::Precondition, config.messages.errNotLive);

    emit logMessage(deps.decisions.showsWelcome() ? config.messages.infoInstallWelcome
                                                  : config.messages.infoInstalling);

    const qint64 memory = deps.probe.totalMemory();
    if (memory > 0 && memory < config.lowMemoryThreshold)
        emit warningIssued(config.messages.warnLowMemory);
    return true;
}

bool InstallWorkflow::selectDisk()
{
    const QList<Disk> candidates = deps.inventory.listCandidateDisks();
    if (candidates.isEmpty())
        return fail(FailureKind::Precondition, config.messages.errNoDisk);

    const QString chosen = deps.decisions.selectDisk(candidates);
    auto it = std::find_if(candidates.cbegin(), candidates.cend(),
                           [&](const Disk &d) { return d.path == chosen; });
    if (it == candidates.cend())
        return fail(FailureKind::Precondition, config.messages.errNoDisk);
    disk = *it;

    emit logMessage(QString("Using disk: %1 (%2 GB)").arg(disk.path).arg(bytesToGib(disk.size)));

    if (availableSpace(config, disk) < config.minRootSize)
        return fail(FailureKind::Precondition,
                    QString("Not enough space on %1 for a root partition").arg(disk.path));
    return true;
}

bool InstallWorkflow::confirm()
{
    if (!deps.decisions.confirmDestructive(config.messages.infoDiskConfirm))
        return fail(FailureKind::Precondition, config.messages.errDiskDeclined);
    return true;
}

bool InstallWorkflow::partition()
{
    plan = planPartitions(config, disk, deps.decisions.rootSize(availableSpace(config, disk)));
    for (const QString &advisory : plan.advisories)
        emit warningIssued(advisory);

    emit logMessage(config.messages.infoPartitioning);
    QString error;
    if (!deps.disks.createPartitionTable(disk.path, "gpt", &error))
        return fail(FailureKind::Resource, error);

    int number = 1;
    for (const PlannedPartition &part : plan.partitions) {
        const QString device = deps.disks.createPartition(disk.path, number++, part.size,
                                                          part.purpose, part.name, &error);
        if (device.isEmpty())
            return fail(FailureKind::Resource, error);
        if (part.purpose == PartitionPurpose::Efi)
            efiDevice = device;
        else
            rootDevice = device;
    }
    return true;
}

bool InstallWorkflow::format()
{
    QString error;
    for (const PlannedPartition &part : plan.partitions) {
        const QString &device = part.purpose == PartitionPurpose::Efi ? efiDevice : rootDevice;
        if (!deps.disks.createFilesystem(device, part.filesystem, part.name, &error))
            return fail(FailureKind::Resource, error);
    }
    return true;
}

bool InstallWorkflow::mount()
{
    const PlannedPartition *root = plan.find(PartitionPurpose::Root);
    const PlannedPartition *efi = plan.find(PartitionPurpose::Efi);

    cleanup->addPath(config.installationDir);
    cleanup->addMount(config.installationDir);
    cleanup->addMount(config.installationEfi());

    if (!QDir().mkpath(config.installationDir))
        return fail(FailureKind::Resource, "Cannot create " + config.installationDir);

    QString error;
    if (!deps.disks.mount(rootDevice, config.installationDir, root->filesystem, {}, &error))
        return fail(FailureKind::Resource, error);
    if (!QDir().mkpath(config.installationEfi()))
        return fail(FailureKind::Resource, "Cannot create " + config.installationEfi());
    if (!deps.disks.mount(efiDevice, config.installationEfi(), efi->filesystem, {}, &error))
        return fail(FailureKind::Resource, error);
    return true;
}

bool InstallWorkflow::copyFiles()
{
    const VersionInfo version = deps.versions.currentVersion();
    ImageRegistry registry(deps.bootloader, config.installationDir);
    const QString name = registry.resolveName(deps.decisions.imageName(defaultImageName(version.version)));

    QString error;
    if (!registry.createRecord(name, version, &record, &error))
        return fail(FailureKind::Resource, error);

    switch (copyBootFiles(config.liveMediumDir, &record, &error)) {
    case CopyStatus::Ok:
        return true;
    case CopyStatus::Interrupted:
        return fail(FailureKind::Interrupt, config.messages.infoInterrupted);
    case CopyStatus::Failed:
        break;
    }
    return fail(FailureKind::Resource, error);
}

bool InstallWorkflow::configureBoot()
{
    consoleType = deps.decisions.consoleType();
    if (consoleType != "kvm" && consoleType != "serial") {
        emit warningIssued(config.messages.warnConsoleTypeInvalid);
        consoleType = QStringLiteral("kvm");
    }

    QString error;
    if (!deps.bootloader.install(disk.path, config.installationBoot(), config.installationEfi(), &error))
        return fail(FailureKind::Resource, error);
    if (!deps.bootloader.setConsoleType(config.installationDir, consoleType, &error))
        return fail(FailureKind::Resource, error);

    ImageRegistry registry(deps.bootloader, config.installationDir);
    if (!registry.registerImage(record, deps.decisions.setAsDefault(), &error))
        return fail(FailureKind::Resource, error);
    return true;
}

bool InstallWorkflow::createUser()
{
    QString error;
    const QString hashed = deps.hasher.hash(deps.decisions.adminPassword(), &error);
    if (hashed.isEmpty())
        return fail(FailureKind::Resource, error);
    if (!writeConfigSeed(record, hashed, consoleType, &error))
        return fail(FailureKind::Resource, error);
    return true;
}

bool InstallWorkflow::finalize()
{
    ::sync();
    // The image stays; only the mounts are released.
    cleanup->releasePath(config.installationDir);
    return true;
}
