#ifndef VERSIONREADER_H
#define VERSIONREADER_H

#include <QString>

class InstallConfig;

struct VersionInfo {
    QString version;
    QString architecture;
    QString flavor;
    QString releaseTrain;
    QString builtOn;

    bool hasVersionFile = false;
};

// Parses version.json; returns a record with version "unknown" when the data
// is absent or malformed.
VersionInfo parseVersionFile(const QString &path);

class VersionReader {
public:
    virtual ~VersionReader() = default;
    virtual VersionInfo currentVersion() const = 0;
    virtual VersionInfo imageVersion(const QString &mountDir) const = 0;
};

class FileVersionReader : public VersionReader {
public:
    explicit FileVersionReader(const InstallConfig &config);

    VersionInfo currentVersion() const override;
    // Legacy images have no live/version.json.
    VersionInfo imageVersion(const QString &mountDir) const override;

private:
    const InstallConfig &config;
};

#endif // VERSIONREADER_H
