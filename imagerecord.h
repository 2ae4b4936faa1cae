#ifndef IMAGERECORD_H
#define IMAGERECORD_H

#include "versionreader.h"

#include <QString>

// One installed image: boot/<name>/ with its rw/ overlay. Created once per
// install or add; never changed afterwards.
struct ImageRecord {
    QString name;
    QString rootDir;      // <root>/boot/<name>
    QString overlayDir;   // <root>/boot/<name>/rw
    QString kernelFile;   // file names inside rootDir, filled by the copy step
    QString initrdFile;
    VersionInfo version;
};

#endif // IMAGERECORD_H
