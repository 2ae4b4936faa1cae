#ifndef BOOTLOADER_H
#define BOOTLOADER_H

#include <QString>
#include <QStringList>

class CommandRunner;
class InstallConfig;
struct ImageRecord;

// Everything the workflows need from the bootloader. `root` is the filesystem
// root that carries boot/ (the installation root, or the persistence root).
class BootloaderIntegrator {
public:
    virtual ~BootloaderIntegrator() = default;

    virtual bool install(const QString &disk, const QString &bootDir, const QString &efiDir,
                         QString *error) = 0;
    virtual bool setConsoleType(const QString &root, const QString &consoleType, QString *error) = 0;
    virtual bool addVersion(const QString &root, const ImageRecord &record, QString *error) = 0;
    virtual bool removeVersion(const QString &root, const QString &name, QString *error) = 0;
    virtual QStringList versions(const QString &root) const = 0;
    virtual bool setDefault(const QString &root, const QString &name, QString *error) = 0;
    virtual QString defaultVersion(const QString &root) const = 0;
};

class GrubBootloader : public BootloaderIntegrator {
public:
    GrubBootloader(const InstallConfig &config, CommandRunner &runner);

    bool install(const QString &disk, const QString &bootDir, const QString &efiDir,
                 QString *error) override;
    bool setConsoleType(const QString &root, const QString &consoleType, QString *error) override;
    bool addVersion(const QString &root, const ImageRecord &record, QString *error) override;
    bool removeVersion(const QString &root, const QString &name, QString *error) override;
    QStringList versions(const QString &root) const override;
    bool setDefault(const QString &root, const QString &name, QString *error) override;
    QString defaultVersion(const QString &root) const override;

    static QString grubDir(const QString &root);
    static QString versionsDir(const QString &root);
    static QString defaultsFile(const QString &root);

private:
    bool writeBaseConfig(const QString &bootDir, QString *error);
    bool setVariable(const QString &root, const QString &name, const QString &value, QString *error);
    QString variable(const QString &root, const QString &name) const;

    const InstallConfig &config;
    CommandRunner &runner;
};

// Writes the whole file or nothing.
bool writeFileAtomically(const QString &path, const QByteArray &content, QString *error);

#endif // BOOTLOADER_H
