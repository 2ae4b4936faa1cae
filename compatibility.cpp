#include "compatibility.h"

#include "installconfig.h"
#include "versionreader.h"

CompatibilityChecker::CompatibilityChecker(const Messages &messages) : messages(messages) {}

CompatibilityResult CompatibilityChecker::check(const VersionInfo &current,
                                                const VersionInfo &candidate,
                                                bool force) const
{
    CompatibilityResult result;
    auto reject = [&result](const QString &message) {
        result.compatible = false;
        result.error = message;
        return result;
    };

    if (current.architecture.isEmpty() || current.flavor.isEmpty())
        return reject(messages.errCorruptCurrentImage);

    // Booting a kernel built for another architecture cannot be undone from
    // the running system, so neither a missing field nor force helps here.
    if (candidate.architecture.isEmpty())
        return reject(messages.errMissingArchitecture);
    if (candidate.architecture != current.architecture)
        return reject(messages.errArchitectureMismatch.arg(current.architecture, candidate.architecture));

    if (candidate.flavor.isEmpty()) {
        if (!force)
            return reject(messages.errMissingFlavor);
        result.warnings << messages.warnMissingFlavorForced;
    } else if (candidate.flavor != current.flavor) {
        if (!force)
            return reject(messages.errFlavorMismatch.arg(current.flavor, candidate.flavor));
        result.warnings << messages.warnFlavorMismatch.arg(current.flavor, candidate.flavor);
    }

    return result;
}
