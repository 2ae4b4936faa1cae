#include "imageregistry.h"

#include "bootloader.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <algorithm>

bool isValidImageName(const QString &name)
{
    static const QRegularExpression re("^[A-Za-z0-9_-]{1,64}$");
    return re.match(name).hasMatch();
}

QString defaultImageName(const QString &version)
{
    QString name = version.trimmed();
    name.replace(QRegularExpression("[^A-Za-z0-9._-]"), "_");
    name = name.left(64);
    if (name.isEmpty() || name == "." || name == "..")
        return QStringLiteral("unknown");
    return name;
}

ImageRegistry::ImageRegistry(BootloaderIntegrator &bootloader, const QString &root)
    : bootloader(bootloader), rootDir(root) {}

QString ImageRegistry::bootDir() const
{
    return QDir::cleanPath(rootDir + "/boot");
}

QStringList ImageRegistry::installedImages() const
{
    QSet<QString> names;
    for (const QString &name : bootloader.versions(rootDir))
        names.insert(name);

    // A directory without a boot entry (an interrupted earlier run) still
    // owns its name.
    const QDir boot(bootDir());
    for (const QString &dir : boot.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        if (QFileInfo::exists(boot.filePath(dir) + "/rw"))
            names.insert(dir);
    }

    QStringList sorted(names.begin(), names.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

QString ImageRegistry::resolveName(const QString &candidate) const
{
    const QStringList installed = installedImages();
    if (!installed.contains(candidate))
        return candidate;

    int counter = 1;
    while (installed.contains(QString("%1.%2").arg(candidate).arg(counter)))
        ++counter;
    return QString("%1.%2").arg(candidate).arg(counter);
}

bool ImageRegistry::createRecord(const QString &name, const VersionInfo &version,
                                 ImageRecord *record, QString *error)
{
    ImageRecord rec;
    rec.name = name;
    rec.rootDir = bootDir() + "/" + name;
    rec.overlayDir = rec.rootDir + "/rw";
    rec.version = version;

    if (QFileInfo::exists(rec.rootDir)) {
        if (error)
            *error = QString("An image named \"%1\" already exists in %2").arg(name, bootDir());
        return false;
    }
    if (!QDir().mkpath(rec.overlayDir)) {
        if (error)
            *error = "Cannot create image directory " + rec.overlayDir;
        return false;
    }
    qDebug() << "Created image directory" << rec.rootDir;
    *record = rec;
    return true;
}

bool ImageRegistry::registerImage(const ImageRecord &record, bool makeDefault, QString *error)
{
    if (!bootloader.addVersion(rootDir, record, error))
        return false;
    if (!makeDefault || bootloader.setDefault(rootDir, record.name, error))
        return true;

    // An entry whose image directory is about to be cleaned up must not stay.
    QString rollbackError;
    if (!bootloader.removeVersion(rootDir, record.name, &rollbackError))
        qWarning().noquote() << rollbackError;
    return false;
}

QString ImageRegistry::defaultImage() const
{
    return bootloader.defaultVersion(rootDir);
}
