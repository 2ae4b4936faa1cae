#ifndef FAILURE_H
#define FAILURE_H

#include <QString>

enum class FailureKind {
    None,
    Precondition,   // wrong boot mode, unsaved commits, no disk, no space
    Compatibility,  // architecture, flavor, checksum or signature
    Resource,       // partition, format, mount, copy
    Interrupt       // SIGINT/SIGTERM
};

struct Failure {
    FailureKind kind = FailureKind::None;
    QString message;

    bool isSet() const { return kind != FailureKind::None; }
};

// Process exit status for a finished workflow. An interrupt is a controlled
// stop and exits like a success.
int exitCodeFor(const Failure &failure);

#endif // FAILURE_H
