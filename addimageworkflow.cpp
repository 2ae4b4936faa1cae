#include "addimageworkflow.h"

#include "cleanupcoordinator.h"
#include "compatibility.h"
#include "datamigration.h"
#include "decisionsource.h"
#include "diskinventory.h"
#include "diskoperations.h"
#include "downloader.h"
#include "imagefiles.h"
#include "imageintegrity.h"
#include "imageregistry.h"
#include "installconfig.h"
#include "interrupt.h"
#include "systemprobe.h"
#include "unsavedchanges.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QUrl>

AddImageWorkflow::AddImageWorkflow(const InstallConfig &config, const Collaborators &deps,
                                   const AddImageRequest &request, QObject *parent)
    : QObject(parent), config(config), deps(deps), request(request) {}

void AddImageWorkflow::setState(State state)
{
    current = state;
    qDebug() << "Add image state:" << state;
    emit stateChanged(state);
}

bool AddImageWorkflow::fail(FailureKind kind, const QString &message)
{
    lastFailure.kind = kind;
    lastFailure.message = message;
    return false;
}

bool AddImageWorkflow::run()
{
    struct Step {
        State state;
        bool (AddImageWorkflow::*action)();
    };
    static const Step steps[] = {
        {Precheck, &AddImageWorkflow::precheck},
        {AcquireSource, &AddImageWorkflow::acquireSource},
        {MountSource, &AddImageWorkflow::mountSource},
        {ReadVersion, &AddImageWorkflow::readVersion},
        {CheckUnsaved, &AddImageWorkflow::checkUnsaved},
        {CheckCompat, &AddImageWorkflow::checkCompat},
        {NameResolve, &AddImageWorkflow::resolveName},
        {CopyFiles, &AddImageWorkflow::copyFiles},
        {MigrateData, &AddImageWorkflow::migrateData},
        {Register, &AddImageWorkflow::registerImage},
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
    if (!ok && lastFailure.kind != FailureKind::Interrupt && interruptRequested())
        fail(FailureKind::Interrupt, config.messages.infoInterrupted);

    if (!ok) {
        setState(Failed);
        if (lastFailure.kind != FailureKind::Interrupt)
            emit errorOccurred(lastFailure.message);
    }

    // The source mount and any download go away on both paths.
    setState(Cleanup);
    scope.run();
    cleanup = nullptr;

    if (!ok) {
        setState(Exit);
        emit finished();
        return false;
    }
    setState(Done);
    emit logMessage(config.messages.infoAddSuccess.arg(record.name));
    emit finished();
    return true;
}

bool AddImageWorkflow::precheck()
{
    if (deps.probe.isLiveBoot())
        return fail(FailureKind::Precondition, config.messages.errLive);

    root = deps.inventory.persistenceRoot();
    qDebug() << "Persistence root:" << root;
    if (deps.probe.freeSpace(root) < config.minFreeSpaceForAdd)
        return fail(FailureKind::Precondition, config.messages.errNotEnoughSpace);
    return true;
}

bool AddImageWorkflow::acquireSource()
{
    if (isRemoteLocation(request.imagePath)) {
        emit logMessage(config.messages.infoDownloading.arg(request.imagePath));
        sourceFile = config.downloadPath;
        cleanup->addPath(sourceFile);

        DownloadRequest download;
        download.url = request.imagePath;
        download.destination = sourceFile;
        download.vrf = request.vrf;
        download.username = request.username;
        download.password = request.password;
        QString error;
        if (!deps.downloader.download(download, &error))
            return fail(interruptRequested() ? FailureKind::Interrupt : FailureKind::Resource, error);
    } else {
        const QUrl url(request.imagePath);
        sourceFile = url.isLocalFile() ? url.toLocalFile() : request.imagePath;
    }

    if (!QFileInfo(sourceFile).isFile())
        return fail(FailureKind::Precondition, "Image file " + sourceFile + " does not exist");
    return true;
}

bool AddImageWorkflow::mountSource()
{
    if (!QDir().mkpath(config.isoMountDir))
        return fail(FailureKind::Resource, "Cannot create " + config.isoMountDir);
    cleanup->addMount(config.isoMountDir);

    QString error;
    if (!deps.disks.mount(sourceFile, config.isoMountDir, "iso9660", {"loop", "ro"}, &error))
        return fail(FailureKind::Resource, error);
    return true;
}

bool AddImageWorkflow::readVersion()
{
    version = deps.versions.imageVersion(config.isoMountDir);
    if (!version.hasVersionFile)
        emit warningIssued("The image carries no version information (legacy image?)");
    emit logMessage("Image version: " + version.version);
    return true;
}

bool AddImageWorkflow::checkUnsaved()
{
    if (deps.unsaved.hasUnsavedChanges() && !deps.decisions.acceptUnsavedChanges())
        return fail(FailureKind::Precondition, config.messages.errUnsavedCommits);
    return true;
}

bool AddImageWorkflow::checkCompat()
{
    const CompatibilityChecker checker(config.messages);
    const CompatibilityResult result = checker.check(deps.versions.currentVersion(), version, request.force);
    for (const QString &warning : result.warnings)
        emit warningIssued(warning);
    if (!result.compatible)
        return fail(FailureKind::Compatibility, result.error + "\n" + config.messages.errIncompatibleImage);

    QString error;
    if (!verifyChecksums(config, config.isoMountDir, &error))
        return fail(FailureKind::Compatibility, error);

    switch (deps.signatures.verify(sourceFile)) {
    case SignatureStatus::Valid:
        emit logMessage("Signature is valid.");
        break;
    case SignatureStatus::Unavailable:
        emit warningIssued(config.messages.warnSignatureUnavailable);
        break;
    case SignatureStatus::Invalid:
        return fail(FailureKind::Compatibility, config.messages.warnSignatureInvalid);
    case SignatureStatus::Unsupported:
        return fail(FailureKind::Compatibility, config.messages.errUnsupportedSignature);
    }
    return true;
}

bool AddImageWorkflow::resolveName()
{
    ImageRegistry registry(deps.bootloader, root);
    imageName = registry.resolveName(deps.decisions.imageName(defaultImageName(version.version)));
    emit logMessage("Installing image: " + imageName);
    return true;
}

bool AddImageWorkflow::copyFiles()
{
    ImageRegistry registry(deps.bootloader, root);
    QString error;
    if (!registry.createRecord(imageName, version, &record, &error))
        return fail(FailureKind::Resource, error);
    // Until it is registered the directory is a leftover, not an image.
    cleanup->addPath(record.rootDir);

    switch (copyBootFiles(config.isoLiveDir(), &record, &error)) {
    case CopyStatus::Ok:
        return true;
    case CopyStatus::Interrupted:
        return fail(FailureKind::Interrupt, config.messages.infoInterrupted);
    case CopyStatus::Failed:
        break;
    }
    return fail(FailureKind::Resource, error);
}

bool AddImageWorkflow::migrateData()
{
    if (!deps.decisions.migrateData())
        return true;
    for (const QString &advisory : migrateRunningData(config, record))
        emit warningIssued(advisory);
    return true;
}

bool AddImageWorkflow::registerImage()
{
    ImageRegistry registry(deps.bootloader, root);
    QString error;
    if (!registry.registerImage(record, deps.decisions.setAsDefault(), &error))
        return fail(FailureKind::Resource, error);
    cleanup->releasePath(record.rootDir);
    return true;
}
