#include "versionreader.h"

#include "installconfig.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

VersionInfo parseVersionFile(const QString &path)
{
    VersionInfo info;
    info.version = QStringLiteral("unknown");

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qDebug() << "No version data at" << path;
        return info;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Malformed version data in" << path << ":" << parseError.errorString();
        return info;
    }

    const QJsonObject obj = doc.object();
    info.hasVersionFile = true;
    const QString version = obj.value("version").toString().trimmed();
    if (!version.isEmpty())
        info.version = version;
    info.architecture = obj.value("architecture").toString().trimmed();
    info.flavor = obj.value("flavor").toString().trimmed();
    info.releaseTrain = obj.value("release_train").toString();
    info.builtOn = obj.value("built_on").toString();
    return info;
}

FileVersionReader::FileVersionReader(const InstallConfig &config) : config(config) {}

VersionInfo FileVersionReader::currentVersion() const
{
    return parseVersionFile(config.currentVersionFile);
}

VersionInfo FileVersionReader::imageVersion(const QString &mountDir) const
{
    return parseVersionFile(mountDir + "/live/version.json");
}
