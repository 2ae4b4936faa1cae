#include "datamigration.h"

#include "imagerecord.h"
#include "installconfig.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

bool copyDirectoryRecursively(const QString &source, const QString &destination, QString *error)
{
    const QDir src(source);
    if (!src.exists()) {
        if (error)
            *error = source + " does not exist";
        return false;
    }
    if (!QDir().mkpath(destination)) {
        if (error)
            *error = "Cannot create " + destination;
        return false;
    }

    QDirIterator it(source, QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot | QDir::System,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fi = it.fileInfo();
        const QString target = destination + "/" + src.relativeFilePath(fi.filePath());
        if (fi.isDir() && !fi.isSymLink()) {
            if (!QDir().mkpath(target)) {
                if (error)
                    *error = "Cannot create " + target;
                return false;
            }
            continue;
        }
        QFile::remove(target);
        const bool copied = fi.isSymLink() ? QFile::link(fi.symLinkTarget(), target)
                                           : QFile::copy(fi.filePath(), target);
        if (!copied) {
            if (error)
                *error = QString("Cannot copy %1 to %2").arg(fi.filePath(), target);
            return false;
        }
    }
    return true;
}

struct LocalUser {
    QString name;
    QString home;
};

// Regular accounts (uid >= 1000) with a home directory.
static QList<LocalUser> localUsers(const QString &passwdFile)
{
    QList<LocalUser> users;
    QFile f(passwdFile);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return users;
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QStringList cols = in.readLine().split(':');
        if (cols.size() < 7)
            continue;
        bool ok = false;
        const int uid = cols.at(2).toInt(&ok);
        if (!ok || uid < 1000 || uid == 65534)
            continue;
        users.append(LocalUser{cols.at(0), cols.at(5)});
    }
    return users;
}

QStringList migrateRunningData(const InstallConfig &config, const ImageRecord &record)
{
    QStringList advisories;
    QString error;

    qInfo() << "Copying configuration to the new image...";
    if (!copyDirectoryRecursively(config.configDir, record.overlayDir + config.configDir, &error))
        advisories << "Failed to copy the running configuration: " + error;

    const QDir ssh(config.sshDir);
    const QFileInfoList hostKeys = ssh.entryInfoList({"ssh_host_*"}, QDir::Files);
    if (!hostKeys.isEmpty()) {
        const QString target = record.overlayDir + "/etc/ssh";
        QDir().mkpath(target);
        for (const QFileInfo &key : hostKeys) {
            const QString dest = target + "/" + key.fileName();
            QFile::remove(dest);
            if (!QFile::copy(key.filePath(), dest))
                advisories << "Failed to copy SSH host key " + key.fileName();
            else
                QFile::setPermissions(dest, key.permissions());
        }
    }

    for (const LocalUser &user : localUsers(config.passwdFile)) {
        const QString knownHosts = user.home + "/.ssh/known_hosts";
        if (!QFileInfo::exists(knownHosts))
            continue;
        const QString targetDir = record.overlayDir + "/home/" + user.name + "/.ssh";
        QDir().mkpath(targetDir);
        QFile::remove(targetDir + "/known_hosts");
        if (!QFile::copy(knownHosts, targetDir + "/known_hosts"))
            advisories << "Failed to migrate SSH known_hosts of " + user.name;
        else
            qDebug() << "Migrated known_hosts of" << user.name;
    }

    return advisories;
}
