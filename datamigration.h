#ifndef DATAMIGRATION_H
#define DATAMIGRATION_H

#include <QString>
#include <QStringList>

class InstallConfig;
struct ImageRecord;

// Carries the running configuration, SSH host keys and users' known_hosts
// into the new image's overlay. Nothing here is fatal: problems come back as
// advisory messages.
QStringList migrateRunningData(const InstallConfig &config, const ImageRecord &record);

bool copyDirectoryRecursively(const QString &source, const QString &destination, QString *error);

#endif // DATAMIGRATION_H
