#ifndef INSTALLWORKFLOW_H
#define INSTALLWORKFLOW_H

#include "collaborators.h"
#include "diskinventory.h"
#include "failure.h"
#include "imagerecord.h"
#include "partitionplanner.h"

#include <QObject>
#include <QString>

class CleanupCoordinator;
class InstallConfig;

// Fresh installation from the live medium onto an empty disk.
class InstallWorkflow : public QObject {
    Q_OBJECT
public:
    enum State {
        Precheck,
        DiskSelect,
        Confirm,
        Partition,
        Format,
        Mount,
        CopyFiles,
        ConfigureBoot,
        CreateUser,
        Finalize,
        Done,
        Failed,
        Cleanup,
        Exit
    };
    Q_ENUM(State)

    InstallWorkflow(const InstallConfig &config, const Collaborators &deps, QObject *parent = nullptr);

    // Runs to Done or Exit. False means failure() says why.
    bool run();

    State state() const { return current; }
    Failure failure() const { return lastFailure; }
    ImageRecord installedImage() const { return record; }
    PartitionPlan partitionPlan() const { return plan; }

signals:
    void logMessage(const QString &message);
    void warningIssued(const QString &message);
    void errorOccurred(const QString &message);
    void stateChanged(InstallWorkflow::State state);
    void finished();

private:
    bool precheck();
    bool selectDisk();
    bool confirm();
    bool partition();
    bool format();
    bool mount();
    bool copyFiles();
    bool configureBoot();
    bool createUser();
    bool finalize();

    void setState(State state);
    bool fail(FailureKind kind, const QString &message);

    const InstallConfig &config;
    Collaborators deps;
    CleanupCoordinator *cleanup = nullptr;

    State current = Precheck;
    Failure lastFailure;
    Disk disk;
    PartitionPlan plan;
    QString efiDevice;
    QString rootDevice;
    QString consoleType;
    ImageRecord record;
};

#endif // INSTALLWORKFLOW_H
