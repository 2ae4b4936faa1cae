#include "unsavedchanges.h"

#include "commandrunner.h"
#include "installconfig.h"

#include <QDebug>
#include <QFile>
#include <QStringList>

ConfigSessionChecker::ConfigSessionChecker(const InstallConfig &config, CommandRunner &runner)
    : config(config), runner(runner) {}

QString ConfigSessionChecker::normalizeConfig(const QString &text)
{
    QStringList kept;
    for (const QString &raw : text.split('\n')) {
        const QString line = raw.trimmed();
        if (line.isEmpty() || line.startsWith("//") || line.startsWith("/*") || line.startsWith('#'))
            continue;
        kept << line;
    }
    return kept.join('\n');
}

bool ConfigSessionChecker::hasUnsavedChanges()
{
    const CommandResult active = runner.run("cli-shell-api", {"showConfig", "--show-active-only"});
    if (!active.ok()) {
        // Without a config session there is nothing uncommitted to lose.
        qDebug().noquote() << describeFailure("cli-shell-api", active);
        return false;
    }

    QFile saved(config.configDir + "/config.boot");
    if (!saved.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Cannot read the saved configuration:" << saved.errorString();
        return true;
    }

    return normalizeConfig(active.stdOut) != normalizeConfig(QString::fromUtf8(saved.readAll()));
}
