#ifndef SYSTEMPROBE_H
#define SYSTEMPROBE_H

#include <QString>
#include <QtGlobal>

class InstallConfig;

// Facts about the running system that gate the workflows.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;
    virtual bool isLiveBoot() const = 0;
    virtual qint64 totalMemory() const = 0;
    virtual qint64 freeSpace(const QString &path) const = 0;
};

class HostSystemProbe : public SystemProbe {
public:
    explicit HostSystemProbe(const InstallConfig &config);

    // Booted from the live medium: the kernel was started with boot=live and
    // without an installed image union.
    bool isLiveBoot() const override;
    qint64 totalMemory() const override;
    qint64 freeSpace(const QString &path) const override;

private:
    const InstallConfig &config;
};

bool runningAsRoot();

#endif // SYSTEMPROBE_H
