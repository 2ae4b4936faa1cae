#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include <QByteArray>
#include <QString>

class CommandRunner;

struct DownloadRequest {
    QString url;
    QString destination;
    QString vrf;
    QString username;
    QString password;
};

class Downloader {
public:
    virtual ~Downloader() = default;
    // Blocks until done. The destination does not exist after a failure.
    virtual bool download(const DownloadRequest &request, QString *error) = 0;
};

// QNetworkAccessManager for the default routing table; a VRF needs the
// process itself to run inside it, so that case goes through `ip vrf exec`.
class NetworkDownloader : public Downloader {
public:
    explicit NetworkDownloader(CommandRunner &runner);

    bool download(const DownloadRequest &request, QString *error) override;

private:
    bool downloadInVrf(const DownloadRequest &request, QString *error);

    CommandRunner &runner;
};

// Double-quoted value for a curl config file line.
QByteArray curlConfigQuoted(const QString &value);

// Anything with a URL scheme other than file: is fetched.
bool isRemoteLocation(const QString &location);

#endif // DOWNLOADER_H
