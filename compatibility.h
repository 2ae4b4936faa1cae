#ifndef COMPATIBILITY_H
#define COMPATIBILITY_H

#include <QString>
#include <QStringList>

struct Messages;
struct VersionInfo;

struct CompatibilityResult {
    bool compatible = true;
    QString error;
    QStringList warnings;
};

// Decides whether an image built for `candidate` may replace `current`.
// Architecture is never negotiable; flavor may be overridden with force.
class CompatibilityChecker {
public:
    explicit CompatibilityChecker(const Messages &messages);

    CompatibilityResult check(const VersionInfo &current,
                              const VersionInfo &candidate,
                              bool force) const;

private:
    const Messages &messages;
};

#endif // COMPATIBILITY_H
