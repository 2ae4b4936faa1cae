#include "imagefiles.h"

#include "bootloader.h"
#include "imagerecord.h"
#include "interrupt.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

static const qint64 copyChunkSize = 4 * 1024 * 1024;

CopyStatus copyFileChunked(const QString &source, const QString &destination, QString *error)
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QString("Cannot read %1: %2").arg(source, in.errorString());
        return CopyStatus::Failed;
    }
    QFile out(destination);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error)
            *error = QString("Cannot write %1: %2").arg(destination, out.errorString());
        return CopyStatus::Failed;
    }

    auto abandon = [&](CopyStatus status) {
        out.close();
        out.remove();
        return status;
    };

    while (!in.atEnd()) {
        if (interruptRequested())
            return abandon(CopyStatus::Interrupted);
        const QByteArray chunk = in.read(copyChunkSize);
        if (chunk.isEmpty() && in.error() != QFileDevice::NoError) {
            if (error)
                *error = QString("Read error on %1: %2").arg(source, in.errorString());
            return abandon(CopyStatus::Failed);
        }
        if (out.write(chunk) != chunk.size() || !out.flush()) {
            if (error) {
                *error = out.error() == QFileDevice::ResourceError
                             ? QString("Not enough space to copy %1").arg(QFileInfo(source).fileName())
                             : QString("Write error on %1: %2").arg(destination, out.errorString());
            }
            return abandon(CopyStatus::Failed);
        }
    }
    out.setPermissions(in.permissions());
    return CopyStatus::Ok;
}

CopyStatus copyBootFiles(const QString &liveDir, ImageRecord *record, QString *error)
{
    const QDir live(liveDir);
    const QFileInfoList kernels = live.entryInfoList({"vmlinuz*"}, QDir::Files, QDir::Name);
    const QFileInfoList initrds = live.entryInfoList({"initrd*"}, QDir::Files, QDir::Name);
    const QString squashfs = live.filePath("filesystem.squashfs");

    if (kernels.isEmpty() || initrds.isEmpty()) {
        if (error)
            *error = "No kernel or initrd found in " + liveDir;
        return CopyStatus::Failed;
    }
    if (!QFileInfo(squashfs).isFile()) {
        if (error)
            *error = "No root filesystem image found at " + squashfs;
        return CopyStatus::Failed;
    }

    qInfo() << "Copying system files...";
    for (const QFileInfo &fi : kernels + initrds) {
        const CopyStatus status = copyFileChunked(fi.absoluteFilePath(),
                                                  record->rootDir + "/" + fi.fileName(), error);
        if (status != CopyStatus::Ok)
            return status;
    }
    record->kernelFile = kernels.first().fileName();
    record->initrdFile = initrds.first().fileName();

    return copyFileChunked(squashfs, record->rootDir + "/" + record->name + ".squashfs", error);
}

QString configSeedPath(const ImageRecord &record)
{
    return record.overlayDir + "/opt/vyatta/etc/config/config.boot";
}

bool writeConfigSeed(const ImageRecord &record, const QString &encryptedPassword,
                     const QString &consoleType, QString *error)
{
    const QString device = consoleType == "serial" ? "ttyS0" : "tty0";

    QString seed;
    QTextStream out(&seed);
    out << "system {\n"
        << "    console {\n"
        << "        device " << device << " {\n";
    if (consoleType == "serial")
        out << "            speed 115200\n";
    out << "        }\n"
        << "    }\n"
        << "    host-name vyos\n"
        << "    login {\n"
        << "        user vyos {\n"
        << "            authentication {\n"
        << "                encrypted-password \"" << encryptedPassword << "\"\n"
        << "            }\n"
        << "        }\n"
        << "    }\n"
        << "}\n";
    out.flush();

    return writeFileAtomically(configSeedPath(record), seed.toUtf8(), error);
}
