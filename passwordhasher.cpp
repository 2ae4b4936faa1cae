#include "passwordhasher.h"

#include "commandrunner.h"

PasswordStrength evaluateStrength(const QString &password)
{
    if (password.size() < 8)
        return PasswordStrength::Short;

    bool lower = false, upper = false, digit = false, other = false;
    for (const QChar c : password) {
        if (c.isLower()) lower = true;
        else if (c.isUpper()) upper = true;
        else if (c.isDigit()) digit = true;
        else other = true;
    }
    const int classes = int(lower) + int(upper) + int(digit) + int(other);
    return classes < 3 ? PasswordStrength::Weak : PasswordStrength::Ok;
}

MkpasswdHasher::MkpasswdHasher(CommandRunner &runner) : runner(runner) {}

QString MkpasswdHasher::hash(const QString &password, QString *error)
{
    // Password goes through stdin so it never shows up in the process list.
    const CommandResult result = runner.run("mkpasswd", {"--method=sha-512", "--rounds=656000", "--stdin"},
                                            password.toUtf8() + '\n');
    const QString hashed = result.stdOut.trimmed();
    if (!result.ok() || !hashed.startsWith("$6$")) {
        if (error)
            *error = "Failed to encrypt the password: " + describeFailure("mkpasswd", result);
        return QString();
    }
    return hashed;
}
