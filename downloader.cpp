#include "downloader.h"

#include "commandrunner.h"
#include "interrupt.h"

#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

bool isRemoteLocation(const QString &location)
{
    const QUrl url(location);
    return url.isValid() && !url.scheme().isEmpty() && url.scheme() != "file"
           && url.scheme().size() > 1;   // "C:" style paths are not URLs
}

NetworkDownloader::NetworkDownloader(CommandRunner &runner) : runner(runner) {}

bool NetworkDownloader::download(const DownloadRequest &request, QString *error)
{
    qDebug().noquote() << "GET" << request.url << (request.vrf.isEmpty() ? QString() : "in VRF " + request.vrf);
    if (!request.vrf.isEmpty())
        return downloadInVrf(request, error);

    QUrl url(request.url);
    if (!request.username.isEmpty()) {
        url.setUserName(request.username);
        url.setPassword(request.password);
    }

    QFile file(request.destination);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error)
            *error = QString("Unable to open %1 for writing: %2").arg(request.destination, file.errorString());
        return false;
    }

    QNetworkAccessManager manager;
    QNetworkRequest netRequest(url);
    netRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                            QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = manager.get(netRequest);

    bool writeFailed = false;
    QObject::connect(reply, &QNetworkReply::readyRead, [&]() {
        const QByteArray data = reply->readAll();
        if (file.write(data) != data.size()) {
            writeFailed = true;
            reply->abort();
        }
    });

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, [&]() {
        if (interruptRequested())
            reply->abort();
    });
    interruptPoll.start(200);
    loop.exec();
    interruptPoll.stop();

    file.write(reply->readAll());
    file.close();

    const bool ok = reply->error() == QNetworkReply::NoError && !writeFailed;
    if (!ok) {
        if (error) {
            if (writeFailed)
                *error = "Failed to download image: cannot write " + request.destination;
            else if (interruptRequested())
                *error = "Download interrupted";
            else
                *error = "Failed to download image: " + reply->errorString();
        }
        QFile::remove(request.destination);
    }
    reply->deleteLater();
    return ok;
}

// Double-quoted curl config value: backslash, quote and line breaks escaped.
QByteArray curlConfigQuoted(const QString &value)
{
    QByteArray quoted = "\"";
    for (const char c : value.toUtf8()) {
        switch (c) {
        case '\\':
        case '"':
            quoted += '\\';
            quoted += c;
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\r':
            quoted += "\\r";
            break;
        default:
            quoted += c;
        }
    }
    return quoted + '"';
}

bool NetworkDownloader::downloadInVrf(const DownloadRequest &request, QString *error)
{
    QStringList args{"vrf", "exec", request.vrf, "curl", "--fail", "--silent", "--show-error",
                     "--location", "--output", request.destination};
    QByteArray config;
    if (!request.username.isEmpty()) {
        // Credentials are fed through a curl config on stdin, not argv.
        args << "--config" << "-";
        config = "user = " + curlConfigQuoted(request.username + ":" + request.password) + "\n";
    }
    args << request.url;

    const CommandResult result = runner.run("ip", args, config);
    if (!result.ok()) {
        if (error)
            *error = "Failed to download image: " + describeFailure("curl", result);
        QFile::remove(request.destination);
        return false;
    }
    return true;
}
