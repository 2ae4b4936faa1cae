#ifndef UNSAVEDCHANGES_H
#define UNSAVEDCHANGES_H

#include <QString>

class CommandRunner;
class InstallConfig;

class UnsavedChangesChecker {
public:
    virtual ~UnsavedChangesChecker() = default;
    virtual bool hasUnsavedChanges() = 0;
};

// Compares the active configuration with the saved config.boot, ignoring
// comments and blank lines.
class ConfigSessionChecker : public UnsavedChangesChecker {
public:
    ConfigSessionChecker(const InstallConfig &config, CommandRunner &runner);

    bool hasUnsavedChanges() override;

    static QString normalizeConfig(const QString &text);

private:
    const InstallConfig &config;
    CommandRunner &runner;
};

#endif // UNSAVEDCHANGES_H
