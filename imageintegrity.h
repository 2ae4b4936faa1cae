#ifndef IMAGEINTEGRITY_H
#define IMAGEINTEGRITY_H

#include <QString>

class CommandRunner;
class InstallConfig;

// Checks every entry of <isoMount>/sha256sum.txt against the mounted files.
bool verifyChecksums(const InstallConfig &config, const QString &isoMount, QString *error);

enum class SignatureStatus {
    Valid,
    Unavailable,    // no signature shipped next to the image
    Invalid,
    Unsupported     // a signature of a type we cannot check
};

class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;
    virtual SignatureStatus verify(const QString &imagePath) = 0;
};

// Looks for <image>.minisig, <image>.asc and <image>.sig. Only minisign
// signatures can be checked; anything else counts as a failed verification.
class MinisignVerifier : public SignatureVerifier {
public:
    MinisignVerifier(const InstallConfig &config, CommandRunner &runner);

    SignatureStatus verify(const QString &imagePath) override;

private:
    const InstallConfig &config;
    CommandRunner &runner;
};

#endif // IMAGEINTEGRITY_H
