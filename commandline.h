#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include "decisionsource.h"

#include <QString>
#include <QStringList>
#include <optional>

enum class Action {
    Install,
    Add
};

struct CommandLineOptions {
    Action action = Action::Install;
    bool noPrompt = false;
    bool force = false;
    bool verbose = false;
    QString configFile = QStringLiteral("/etc/image-installer.conf");

    QString imagePath;
    QString vrf;
    QString username;
    QString password;

    DecisionPresets presets;
};

struct ParseResult {
    std::optional<CommandLineOptions> options;
    QString error;       // usage problem, empty on success
    bool helpRequested = false;
    QString helpText;
};

// Arguments as in QCoreApplication::arguments(), program name first.
ParseResult parseCommandLine(const QStringList &arguments);

#endif // COMMANDLINE_H
