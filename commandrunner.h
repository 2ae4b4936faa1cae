#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

struct CommandResult {
    bool started = false;
    int exitCode = -1;
    QString stdOut;
    QString stdErr;

    bool ok() const { return started && exitCode == 0; }
};

// Runs external programs. Everything that touches disks or the bootloader goes
// through here so tests can substitute canned results.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const QString &program,
                              const QStringList &args,
                              const QByteArray &stdinData = QByteArray()) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const QString &program,
                      const QStringList &args,
                      const QByteArray &stdinData = QByteArray()) override;
};

// One-line description of a failed command, for error messages.
QString describeFailure(const QString &program, const CommandResult &result);

#endif // COMMANDRUNNER_H
