#ifndef IMAGEREGISTRY_H
#define IMAGEREGISTRY_H

#include "imagerecord.h"

#include <QString>
#include <QStringList>

class BootloaderIntegrator;

// 1-64 characters of letters, digits, hyphens and underscores.
bool isValidImageName(const QString &name);

// Name derived from a version string, e.g. "1.4.0-rc1" -> "1.4.0-rc1",
// "1.5 beta/2" -> "1.5_beta_2".
QString defaultImageName(const QString &version);

// The only writer of image directories and of the default boot pointer for
// one root (installation root or persistence root).
class ImageRegistry {
public:
    ImageRegistry(BootloaderIntegrator &bootloader, const QString &root);

    QString root() const { return rootDir; }
    QString bootDir() const;

    QStringList installedImages() const;

    // `candidate` if unused, else candidate.N with the lowest free N >= 1.
    QString resolveName(const QString &candidate) const;

    bool createRecord(const QString &name, const VersionInfo &version,
                      ImageRecord *record, QString *error);
    // Adds the boot entry and optionally moves the default pointer. If the
    // pointer cannot be moved the entry is taken out again.
    bool registerImage(const ImageRecord &record, bool makeDefault, QString *error);
    QString defaultImage() const;

private:
    BootloaderIntegrator &bootloader;
    QString rootDir;
};

#endif // IMAGEREGISTRY_H
