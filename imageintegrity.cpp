#include "imageintegrity.h"

#include "commandrunner.h"
#include "installconfig.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>

static QByteArray sha256Of(const QString &path, QString *error)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QString("Cannot read %1: %2").arg(path, f.errorString());
        return QByteArray();
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&f)) {
        if (error)
            *error = QString("Cannot hash %1").arg(path);
        return QByteArray();
    }
    return hash.result().toHex();
}

bool verifyChecksums(const InstallConfig &config, const QString &isoMount, QString *error)
{
    const QString listPath = isoMount + "/sha256sum.txt";
    QFile list(listPath);
    if (!list.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error)
            *error = config.messages.errImproperImage;
        return false;
    }

    const QDir root(isoMount);
    QTextStream in(&list);
    int checked = 0;
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty())
            continue;
        // <hex digest>  ./relative/path  (binary-mode lines use " *")
        const QRegularExpressionMatch m = QRegularExpression("^([0-9a-fA-F]{64})\\s+\\*?(.+)$").match(line);
        if (!m.hasMatch()) {
            qDebug() << "Ignoring malformed checksum line:" << line;
            continue;
        }
        const QString relative = QDir::cleanPath(m.captured(2));
        const QString path = root.filePath(relative);
        const QByteArray actual = sha256Of(path, error);
        if (actual.isEmpty())
            return false;
        if (actual != m.captured(1).toLower().toLatin1()) {
            if (error)
                *error = QString("Checksum mismatch for %1; the image is corrupted.").arg(relative);
            return false;
        }
        ++checked;
    }
    qDebug() << "Verified" << checked << "checksums in" << listPath;
    return true;
}

MinisignVerifier::MinisignVerifier(const InstallConfig &config, CommandRunner &runner)
    : config(config), runner(runner) {}

SignatureStatus MinisignVerifier::verify(const QString &imagePath)
{
    const QString minisig = imagePath + ".minisig";
    if (QFileInfo::exists(minisig)) {
        const CommandResult result = runner.run("minisign", {"-V", "-q",
                                                             "-p", config.signatureKey,
                                                             "-x", minisig,
                                                             "-m", imagePath});
        if (!result.ok()) {
            qDebug().noquote() << describeFailure("minisign", result);
            return SignatureStatus::Invalid;
        }
        return SignatureStatus::Valid;
    }

    for (const QString &ext : {QStringLiteral(".asc"), QStringLiteral(".sig")}) {
        if (QFileInfo::exists(imagePath + ext)) {
            qDebug() << "Found signature" << imagePath + ext << "of an unsupported type";
            return SignatureStatus::Unsupported;
        }
    }
    return SignatureStatus::Unavailable;
}
