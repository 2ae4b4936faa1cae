#include "logging.h"

#include <QByteArray>
#include <QString>
#include <QtGlobal>
#include <cstdio>

static bool verboseOutput = false;

static void consoleMessageHandler(QtMsgType type, const QMessageLogContext &, const QString &msg)
{
    const QByteArray text = msg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
        if (verboseOutput)
            fprintf(stderr, "[debug] %s\n", text.constData());
        break;
    case QtInfoMsg:
        fprintf(stdout, "%s\n", text.constData());
        fflush(stdout);
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", text.constData());
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        fprintf(stderr, "%s\n", text.constData());
        break;
    }
}

void installMessageHandler(bool verbose)
{
    verboseOutput = verbose;
    qInstallMessageHandler(consoleMessageHandler);
}
