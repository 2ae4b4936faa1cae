#include "cleanupcoordinator.h"

#include "diskoperations.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <utility>

CleanupCoordinator::CleanupCoordinator(DiskOperations &disks)
    : disks(disks) {}

CleanupCoordinator::~CleanupCoordinator()
{
    run();
}

void CleanupCoordinator::addMount(const QString &target)
{
    if (!mounts.contains(target))
        mounts.append(target);
}

void CleanupCoordinator::addPath(const QString &path)
{
    if (!paths.contains(path))
        paths.append(path);
}

void CleanupCoordinator::releaseMount(const QString &target)
{
    mounts.removeAll(target);
}

void CleanupCoordinator::releasePath(const QString &path)
{
    paths.removeAll(path);
}

bool CleanupCoordinator::coversBusyMount(const QString &path) const
{
    const QString prefix = QDir::cleanPath(path) + QLatin1Char('/');
    for (const QString &target : busy) {
        const QString cleaned = QDir::cleanPath(target);
        if (cleaned == QDir::cleanPath(path) || cleaned.startsWith(prefix))
            return true;
    }
    return false;
}

void CleanupCoordinator::run()
{
    busy.clear();

    while (!mounts.isEmpty()) {
        const QString target = mounts.takeLast();
        if (!disks.isMounted(target))
            continue;
        QString error;
        if (!disks.unmount(target, &error)) {
            qWarning().noquote() << "Could not unmount" << target + ":" << error;
            busy.append(target);
        } else {
            qDebug() << "Unmounted" << target;
        }
    }

    for (const QString &path : std::as_const(paths)) {
        if (coversBusyMount(path)) {
            qWarning().noquote() << "Leaving" << path << "in place, something is still mounted below it";
            continue;
        }
        const QFileInfo info(path);
        if (!info.exists() && !info.isSymLink())
            continue;
        const bool removed = info.isDir() && !info.isSymLink()
                                 ? QDir(path).removeRecursively()
                                 : QFile::remove(path);
        if (!removed)
            qWarning().noquote() << "Could not remove" << path;
        else
            qDebug() << "Removed" << path;
    }
    paths.clear();
}
