#include "bootloader.h"

#include "commandrunner.h"
#include "imagerecord.h"
#include "installconfig.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QTextStream>

bool writeFileAtomically(const QString &path, const QByteArray &content, QString *error)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        if (error)
            *error = "Cannot create directory for " + path;
        return false;
    }
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate) || f.write(content) != content.size()
        || !f.commit()) {
        if (error)
            *error = QString("Cannot write %1: %2").arg(path, f.errorString());
        return false;
    }
    return true;
}

GrubBootloader::GrubBootloader(const InstallConfig &config, CommandRunner &runner)
    : config(config), runner(runner) {}

QString GrubBootloader::grubDir(const QString &root)
{
    return QDir::cleanPath(root + "/boot/grub");
}

QString GrubBootloader::versionsDir(const QString &root)
{
    return grubDir(root) + "/grub.cfg.d/vyos-versions";
}

QString GrubBootloader::defaultsFile(const QString &root)
{
    return grubDir(root) + "/grub.cfg.d/20-vyos-defaults-autoload.cfg";
}

bool GrubBootloader::install(const QString &disk, const QString &bootDir, const QString &efiDir,
                             QString *error)
{
    qInfo().noquote() << "Installing GRUB to" << disk;
    // --removable writes EFI/BOOT/BOOTX64.EFI so the disk boots without an
    // NVRAM entry; the firmware of many virtual machines forgets those.
    const CommandResult result = runner.run("grub-install", {"--no-floppy",
                                                             "--target=x86_64-efi",
                                                             "--efi-directory=" + efiDir,
                                                             "--boot-directory=" + bootDir,
                                                             "--bootloader-id=" + config.bootloaderId,
                                                             "--no-nvram",
                                                             "--removable",
                                                             disk});
    if (!result.ok()) {
        if (error)
            *error = "Failed to install GRUB: " + describeFailure("grub-install", result);
        return false;
    }
    return writeBaseConfig(bootDir, error);
}

bool GrubBootloader::writeBaseConfig(const QString &bootDir, QString *error)
{
    const QByteArray content =
        "# Generated by image-installer. Per-image entries live in grub.cfg.d/.\n"
        "set timeout=5\n"
        "set console_type=\"kvm\"\n"
        "insmod ext2\n"
        "insmod regexp\n"
        "for cfg in ${prefix}/grub.cfg.d/*.cfg; do\n"
        "    source \"${cfg}\"\n"
        "done\n"
        "for cfg in ${prefix}/grub.cfg.d/vyos-versions/*.cfg; do\n"
        "    source \"${cfg}\"\n"
        "done\n";
    return writeFileAtomically(bootDir + "/grub/grub.cfg", content, error);
}

QString GrubBootloader::variable(const QString &root, const QString &name) const
{
    QFile f(defaultsFile(root));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return QString();
    const QRegularExpression re("^\\s*set\\s+" + QRegularExpression::escape(name) + "=\"?([^\"]*)\"?\\s*$");
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QRegularExpressionMatch m = re.match(in.readLine());
        if (m.hasMatch())
            return m.captured(1);
    }
    return QString();
}

bool GrubBootloader::setVariable(const QString &root, const QString &name, const QString &value,
                                 QString *error)
{
    QStringList lines;
    QFile f(defaultsFile(root));
    if (f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        lines = QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
        f.close();
    }

    const QRegularExpression re("^\\s*set\\s+" + QRegularExpression::escape(name) + "=");
    const QString assignment = QString("set %1=\"%2\"").arg(name, value);
    bool replaced = false;
    for (QString &line : lines) {
        if (re.match(line).hasMatch()) {
            line = assignment;
            replaced = true;
        }
    }
    if (!replaced)
        lines << assignment;

    return writeFileAtomically(defaultsFile(root), (lines.join('\n') + '\n').toUtf8(), error);
}

bool GrubBootloader::setConsoleType(const QString &root, const QString &consoleType, QString *error)
{
    return setVariable(root, "console_type", consoleType, error);
}

bool GrubBootloader::addVersion(const QString &root, const ImageRecord &record, QString *error)
{
    const QString imageDir = "/boot/" + record.name;
    const QString kernelArgs = QString("boot=live rootdelay=5 noautologin net.ifnames=0 biosdevname=0 "
                                       "vyos-union=%1").arg(imageDir);
    const QString linuxLine = QString("linux %1/%2 %3").arg(imageDir, record.kernelFile, kernelArgs);

    QString entry;
    QTextStream out(&entry);
    out << "menuentry \"" << record.name << "\" --id \"" << record.name << "\" {\n"
        << "    if [ \"${console_type}\" = \"serial\" ]; then\n"
        << "        " << linuxLine << " console=ttyS0,115200\n"
        << "    else\n"
        << "        " << linuxLine << " console=tty0\n"
        << "    fi\n"
        << "    initrd " << imageDir << "/" << record.initrdFile << "\n"
        << "}\n";
    out.flush();

    const QString path = versionsDir(root) + "/" + record.name + ".cfg";
    if (!writeFileAtomically(path, entry.toUtf8(), error))
        return false;
    qDebug() << "Registered boot entry" << path;
    return true;
}

bool GrubBootloader::removeVersion(const QString &root, const QString &name, QString *error)
{
    QFile entry(versionsDir(root) + "/" + name + ".cfg");
    if (!entry.exists())
        return true;
    if (!entry.remove()) {
        if (error)
            *error = QString("Cannot remove boot entry %1: %2").arg(entry.fileName(), entry.errorString());
        return false;
    }
    qDebug() << "Removed boot entry" << entry.fileName();
    return true;
}

QStringList GrubBootloader::versions(const QString &root) const
{
    QStringList names;
    const QFileInfoList entries = QDir(versionsDir(root)).entryInfoList({"*.cfg"}, QDir::Files, QDir::Name);
    for (const QFileInfo &fi : entries)
        names << fi.completeBaseName();
    return names;
}

bool GrubBootloader::setDefault(const QString &root, const QString &name, QString *error)
{
    return setVariable(root, "default", name, error);
}

QString GrubBootloader::defaultVersion(const QString &root) const
{
    return variable(root, "default");
}
