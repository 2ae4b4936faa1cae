#ifndef CLEANUPCOORDINATOR_H
#define CLEANUPCOORDINATOR_H

#include <QString>
#include <QStringList>

class DiskOperations;

// Scope guard for what a workflow leaves behind: mount points and temporary
// paths. Mounts are released in reverse order of registration. A path is only
// removed when nothing below it is still mounted.
class CleanupCoordinator {
public:
    explicit CleanupCoordinator(DiskOperations &disks);
    ~CleanupCoordinator();

    CleanupCoordinator(const CleanupCoordinator &) = delete;
    CleanupCoordinator &operator=(const CleanupCoordinator &) = delete;

    void addMount(const QString &target);
    void addPath(const QString &path);
    // The caller unmounted it itself.
    void releaseMount(const QString &target);
    // The path is now a result rather than a leftover.
    void releasePath(const QString &path);

    // Safe to call repeatedly; later calls only handle what was added since.
    void run();

    // Mount points that could not be released by the last run().
    QStringList stillMounted() const { return busy; }

private:
    bool coversBusyMount(const QString &path) const;

    DiskOperations &disks;
    QStringList mounts;
    QStringList paths;
    QStringList busy;
};

#endif // CLEANUPCOORDINATOR_H
