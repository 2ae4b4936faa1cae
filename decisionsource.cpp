#include "decisionsource.h"

#include "imageregistry.h"
#include "installconfig.h"
#include "interrupt.h"
#include "partitionplanner.h"
#include "passwordhasher.h"

#include <QDebug>
#include <termios.h>
#include <unistd.h>

void DecisionSource::advise(const QString &message) const
{
    if (advisoryHandler)
        advisoryHandler(message);
    else
        qWarning().noquote() << message;
}

// ---------------------------------------------------------------------------

NonInteractiveDecisions::NonInteractiveDecisions(const InstallConfig &config, const DecisionPresets &presets)
    : config(config), presets(presets) {}

QString NonInteractiveDecisions::selectDisk(const QList<Disk> &candidates)
{
    if (candidates.isEmpty())
        return QString();
    for (const Disk &disk : candidates) {
        if (!presets.targetDisk.isEmpty() && disk.path == presets.targetDisk)
            return disk.path;
    }
    if (!presets.targetDisk.isEmpty())
        qDebug() << "Requested disk" << presets.targetDisk << "is not a candidate, using the first one";
    return candidates.first().path;
}

bool NonInteractiveDecisions::confirmDestructive(const QString &)
{
    return true;
}

std::optional<qint64> NonInteractiveDecisions::rootSize(qint64)
{
    if (!presets.rootSizeGb)
        return std::nullopt;
    return gibToBytes(*presets.rootSizeGb);
}

QString NonInteractiveDecisions::adminPassword()
{
    if (!presets.adminPassword || presets.adminPassword->isEmpty()) {
        advise(config.messages.warnDefaultPassword);
        return config.defaultPassword;
    }
    const QString password = *presets.adminPassword;
    switch (evaluateStrength(password)) {
    case PasswordStrength::Short:
        advise(config.messages.warnPasswordShort);
        break;
    case PasswordStrength::Weak:
        advise(config.messages.warnPasswordWeak);
        break;
    case PasswordStrength::Ok:
        break;
    }
    return password;
}

QString NonInteractiveDecisions::consoleType()
{
    return presets.consoleType;
}

QString NonInteractiveDecisions::imageName(const QString &suggested)
{
    if (presets.imageName.isEmpty())
        return suggested;
    if (!isValidImageName(presets.imageName)) {
        advise(config.messages.warnImageNameWrong);
        return suggested;
    }
    return presets.imageName;
}

bool NonInteractiveDecisions::setAsDefault()
{
    return presets.setDefault;
}

bool NonInteractiveDecisions::migrateData()
{
    return true;
}

bool NonInteractiveDecisions::acceptUnsavedChanges()
{
    return true;
}

// ---------------------------------------------------------------------------

ConsolePrompter::ConsolePrompter(const InstallConfig &config, const DecisionPresets &presets,
                                 QTextStream &in, QTextStream &out)
    : config(config), presets(presets), in(in), out(out) {}

QString ConsolePrompter::ask(const QString &question, const QString &defaultAnswer)
{
    out << question;
    if (!defaultAnswer.isEmpty())
        out << " (Default: " << defaultAnswer << ")";
    out << ": " << Qt::flush;
    const QString answer = readAnswer().trimmed();
    return answer.isEmpty() ? defaultAnswer : answer;
}

// A null line means the stream is exhausted; an empty one is an empty answer.
QString ConsolePrompter::readAnswer()
{
    const QString line = in.readLine();
    if (line.isNull() || interruptRequested())
        inputClosed = true;
    return line;
}

// Called before repeating a question.
bool ConsolePrompter::cannotAskAgain()
{
    if (!inputClosed && !interruptRequested())
        return false;
    out << "\n" << Qt::flush;
    abort();
    return true;
}

bool ConsolePrompter::askYesNo(const QString &question, bool defaultYes)
{
    for (;;) {
        out << question << (defaultYes ? " [Y/n]: " : " [y/N]: ") << Qt::flush;
        const QString answer = readAnswer().trimmed().toLower();
        if (answer.isEmpty())
            return defaultYes;
        if (answer == "y" || answer == "yes")
            return true;
        if (answer == "n" || answer == "no")
            return false;
        if (cannotAskAgain())
            return defaultYes;
        out << "Please answer yes or no.\n";
    }
}

QString ConsolePrompter::askHidden(const QString &question)
{
    out << question << " " << Qt::flush;
    termios saved{};
    const bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (tty) {
        termios silent = saved;
        silent.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }
    const QString answer = readAnswer();
    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        out << "\n" << Qt::flush;
    }
    return answer;
}

QString ConsolePrompter::selectDisk(const QList<Disk> &candidates)
{
    if (candidates.isEmpty())
        return QString();
    out << "The following disks were found:\n";
    for (const Disk &disk : candidates)
        out << "  Drive: " << disk.path << " (" << bytesToGib(disk.size) << " GB)\n";

    const QString fallback = !presets.targetDisk.isEmpty() ? presets.targetDisk : candidates.first().path;
    for (;;) {
        const QString answer = ask("Which one should be used for installation?", fallback);
        for (const Disk &disk : candidates) {
            if (disk.path == answer || disk.name == answer)
                return disk.path;
        }
        out << "Unknown disk: " << answer << "\n";
        if (cannotAskAgain())
            return QString();
    }
}

bool ConsolePrompter::confirmDestructive(const QString &message)
{
    return askYesNo(message, false);
}

std::optional<qint64> ConsolePrompter::rootSize(qint64 available)
{
    if (presets.rootSizeGb)
        return gibToBytes(*presets.rootSizeGb);
    if (askYesNo("Would you like to use all the free space on the drive?", true))
        return std::nullopt;

    for (;;) {
        const QString answer = ask("Please specify the size (in GB) of the root partition (min is 1.5 GB)?");
        bool ok = false;
        const qint64 size = gibToBytes(answer.toDouble(&ok));
        if (!ok)
            out << "Please enter a number.\n";
        else if (size < config.minRootSize)
            out << config.messages.warnRootSizeTooSmall << "\n";
        else if (size > available)
            out << config.messages.warnRootSizeTooBig << "\n";
        else
            return size;
        if (cannotAskAgain())
            return std::nullopt;
    }
}

QString ConsolePrompter::adminPassword()
{
    if (presets.adminPassword && evaluateStrength(*presets.adminPassword) == PasswordStrength::Ok)
        return *presets.adminPassword;

    for (;;) {
        const QString password = askHidden("Please enter a password for the \"vyos\" user:");
        const PasswordStrength strength = evaluateStrength(password);
        if (strength == PasswordStrength::Short)
            out << config.messages.warnPasswordShort << "\n";
        else if (strength == PasswordStrength::Weak)
            out << config.messages.warnPasswordWeak << "\n";
        else if (askHidden("Please confirm password for the \"vyos\" user:") == password)
            return password;
        else
            out << "The entered values did not match. Try again.\n";
        if (cannotAskAgain())
            return QString();
    }
}

QString ConsolePrompter::consoleType()
{
    const QString fallback = presets.consoleType == "serial" ? "S" : "K";
    const QString answer = ask("What console should be used by default? (K: KVM, S: Serial)?", fallback).toUpper();
    if (answer == "S")
        return QStringLiteral("serial");
    if (answer == "K")
        return QStringLiteral("kvm");
    // Left to the workflow, which falls back to KVM and says so.
    return answer;
}

QString ConsolePrompter::imageName(const QString &suggested)
{
    const QString preset = !presets.imageName.isEmpty() ? presets.imageName : suggested;
    for (;;) {
        const QString answer = ask("What would you like to name this image?", preset);
        // A derived name may carry dots from the version string; anything the
        // operator types must satisfy the stricter rule.
        if (answer == suggested || isValidImageName(answer))
            return answer;
        out << config.messages.warnImageNameWrong << "\n";
        if (cannotAskAgain())
            return suggested;
    }
}

bool ConsolePrompter::setAsDefault()
{
    if (!presets.setDefault)
        return false;
    return askYesNo("Would you like to set the new image as the default one for boot?", true);
}

bool ConsolePrompter::migrateData()
{
    return askYesNo("Would you like to copy data to the new image?", true);
}

bool ConsolePrompter::acceptUnsavedChanges()
{
    return false;
}
