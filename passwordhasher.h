#ifndef PASSWORDHASHER_H
#define PASSWORDHASHER_H

#include <QString>

class CommandRunner;

enum class PasswordStrength {
    Ok,
    Short,   // fewer than 8 characters
    Weak     // fewer than three character classes
};

PasswordStrength evaluateStrength(const QString &password);

class PasswordHasher {
public:
    virtual ~PasswordHasher() = default;
    // crypt(3) string suitable for encrypted-password; empty on failure.
    virtual QString hash(const QString &password, QString *error) = 0;
};

// SHA-512 crypt with 656000 rounds via mkpasswd(1).
class MkpasswdHasher : public PasswordHasher {
public:
    explicit MkpasswdHasher(CommandRunner &runner);

    QString hash(const QString &password, QString *error) override;

private:
    CommandRunner &runner;
};

#endif // PASSWORDHASHER_H
