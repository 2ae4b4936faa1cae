#ifndef IMAGEFILES_H
#define IMAGEFILES_H

#include <QString>

struct ImageRecord;

enum class CopyStatus {
    Ok,
    Failed,
    Interrupted
};

// Copies in chunks, checking for an interrupt between chunks. A partial
// destination is removed on failure.
CopyStatus copyFileChunked(const QString &source, const QString &destination, QString *error);

// Kernel (vmlinuz*) and initrd (initrd*) verbatim, filesystem.squashfs as
// <name>.squashfs. Fills record->kernelFile and record->initrdFile.
CopyStatus copyBootFiles(const QString &liveDir, ImageRecord *record, QString *error);

// rw/opt/vyatta/etc/config/config.boot with the initial "vyos" user.
bool writeConfigSeed(const ImageRecord &record, const QString &encryptedPassword,
                     const QString &consoleType, QString *error);

QString configSeedPath(const ImageRecord &record);

#endif // IMAGEFILES_H
