#include "commandrunner.h"

#include <QDebug>
#include <QProcess>

CommandResult ProcessCommandRunner::run(const QString &program,
                                        const QStringList &args,
                                        const QByteArray &stdinData)
{
    CommandResult result;
    qDebug().noquote() << "→" << program << args.join(' ');

    QProcess process;
    process.start(program, args);
    if (!process.waitForStarted()) {
        result.stdErr = process.errorString();
        return result;
    }
    result.started = true;

    if (!stdinData.isEmpty())
        process.write(stdinData);
    process.closeWriteChannel();

    if (!process.waitForFinished(-1)) {
        result.stdErr = process.errorString();
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdOut = QString::fromUtf8(process.readAllStandardOutput());
    result.stdErr = QString::fromUtf8(process.readAllStandardError());
    if (result.exitCode != 0)
        qDebug().noquote() << "  exit" << result.exitCode << result.stdErr.trimmed();
    return result;
}

QString describeFailure(const QString &program, const CommandResult &result)
{
    if (!result.started)
        return QString("%1 could not be started: %2").arg(program, result.stdErr.trimmed());
    const QString err = result.stdErr.trimmed();
    return err.isEmpty()
               ? QString("%1 failed (exit %2)").arg(program).arg(result.exitCode)
               : QString("%1 failed (exit %2): %3").arg(program).arg(result.exitCode).arg(err);
}
