#include "systemprobe.h"

#include "installconfig.h"

#include <QDebug>
#include <QFile>
#include <QRegularExpression>
#include <QStorageInfo>
#include <QTextStream>
#include <unistd.h>

HostSystemProbe::HostSystemProbe(const InstallConfig &config) : config(config) {}

bool HostSystemProbe::isLiveBoot() const
{
    QFile f(config.kernelCmdline);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Cannot read kernel command line:" << f.errorString();
        return false;
    }
    const QStringList args = QString::fromUtf8(f.readAll()).split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    bool live = false;
    for (const QString &arg : args) {
        if (arg == "boot=live")
            live = true;
        if (arg.startsWith("vyos-union="))
            return false;
    }
    return live;
}

qint64 HostSystemProbe::totalMemory() const
{
    QFile f(config.memInfo);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return 0;
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (!line.startsWith("MemTotal:"))
            continue;
        // MemTotal:       16318452 kB
        const QStringList cols = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        if (cols.size() >= 2)
            return cols.at(1).toLongLong() * 1024;
    }
    return 0;
}

qint64 HostSystemProbe::freeSpace(const QString &path) const
{
    QStorageInfo storage(path);
    if (!storage.isValid())
        return 0;
    return storage.bytesAvailable();
}

bool runningAsRoot()
{
    return geteuid() == 0;
}
