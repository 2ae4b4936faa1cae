#ifndef LOGGING_H
#define LOGGING_H

// Routes qDebug/qInfo/qWarning/qCritical to the terminal the way the CLI
// reports: status on stdout, advisories and errors on stderr.
void installMessageHandler(bool verbose);

#endif // LOGGING_H
