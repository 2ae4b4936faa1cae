#ifndef ADDIMAGEWORKFLOW_H
#define ADDIMAGEWORKFLOW_H

#include "collaborators.h"
#include "failure.h"
#include "imagerecord.h"
#include "versionreader.h"

#include <QObject>
#include <QString>

class CleanupCoordinator;
class InstallConfig;

struct AddImageRequest {
    QString imagePath;   // local file or URL
    QString vrf;
    QString username;
    QString password;
    bool force = false;
};

// Adds an image next to the running installation, on the persistence root.
class AddImageWorkflow : public QObject {
    Q_OBJECT
public:
    enum State {
        Precheck,
        AcquireSource,
        MountSource,
        ReadVersion,
        CheckUnsaved,
        CheckCompat,
        NameResolve,
        CopyFiles,
        MigrateData,
        Register,
        Cleanup,
        Done,
        Failed,
        Exit
    };
    Q_ENUM(State)

    AddImageWorkflow(const InstallConfig &config, const Collaborators &deps,
                     const AddImageRequest &request, QObject *parent = nullptr);

    bool run();

    State state() const { return current; }
    Failure failure() const { return lastFailure; }
    ImageRecord addedImage() const { return record; }

signals:
    void logMessage(const QString &message);
    void warningIssued(const QString &message);
    void errorOccurred(const QString &message);
    void stateChanged(AddImageWorkflow::State state);
    void finished();

private:
    bool precheck();
    bool acquireSource();
    bool mountSource();
    bool readVersion();
    bool checkUnsaved();
    bool checkCompat();
    bool resolveName();
    bool copyFiles();
    bool migrateData();
    bool registerImage();

    void setState(State state);
    bool fail(FailureKind kind, const QString &message);

    const InstallConfig &config;
    Collaborators deps;
    AddImageRequest request;
    CleanupCoordinator *cleanup = nullptr;

    State current = Precheck;
    Failure lastFailure;
    QString root;
    QString sourceFile;
    VersionInfo version;
    QString imageName;
    ImageRecord record;
};

#endif // ADDIMAGEWORKFLOW_H
