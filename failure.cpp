#include "failure.h"

int exitCodeFor(const Failure &failure)
{
    switch (failure.kind) {
    case FailureKind::None:
    case FailureKind::Interrupt:
        return 0;
    case FailureKind::Precondition:
    case FailureKind::Compatibility:
    case FailureKind::Resource:
        break;
    }
    return 1;
}
