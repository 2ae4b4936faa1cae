#ifndef DECISIONSOURCE_H
#define DECISIONSOURCE_H

#include "diskinventory.h"

#include <QList>
#include <QString>
#include <QTextStream>
#include <QtGlobal>
#include <functional>
#include <optional>
#include <utility>

class InstallConfig;

// Values the operator fixed on the command line. Both decision sources start
// from them; only the interactive one asks about what is left open.
struct DecisionPresets {
    QString targetDisk;
    std::optional<double> rootSizeGb;
    std::optional<QString> adminPassword;
    QString consoleType = QStringLiteral("kvm");
    QString imageName;
    bool setDefault = true;
};

// Where the workflows get answers from. The workflows never check which
// implementation they talk to.
class DecisionSource {
public:
    using AdvisoryHandler = std::function<void(const QString &)>;

    virtual ~DecisionSource() = default;

    virtual QString selectDisk(const QList<Disk> &candidates) = 0;
    virtual bool confirmDestructive(const QString &message) = 0;
    // Requested root size in bytes; nullopt means all available space.
    virtual std::optional<qint64> rootSize(qint64 available) = 0;
    virtual QString adminPassword() = 0;
    virtual QString consoleType() = 0;
    virtual QString imageName(const QString &suggested) = 0;
    virtual bool setAsDefault() = 0;
    virtual bool migrateData() = 0;
    virtual bool acceptUnsavedChanges() = 0;
    virtual bool showsWelcome() const = 0;

    void setAdvisoryHandler(AdvisoryHandler handler) { advisoryHandler = std::move(handler); }

    // Set once a question could not be answered (input closed, Ctrl+C). The
    // value returned for that question is then meaningless.
    bool aborted() const { return gaveUp; }

protected:
    void advise(const QString &message) const;
    void abort() { gaveUp = true; }

private:
    AdvisoryHandler advisoryHandler;
    bool gaveUp = false;
};

// --no-prompt: everything comes from presets and documented fallbacks.
class NonInteractiveDecisions : public DecisionSource {
public:
    NonInteractiveDecisions(const InstallConfig &config, const DecisionPresets &presets);

    QString selectDisk(const QList<Disk> &candidates) override;
    bool confirmDestructive(const QString &message) override;
    std::optional<qint64> rootSize(qint64 available) override;
    QString adminPassword() override;
    QString consoleType() override;
    QString imageName(const QString &suggested) override;
    bool setAsDefault() override;
    bool migrateData() override;
    bool acceptUnsavedChanges() override;
    bool showsWelcome() const override { return false; }

private:
    const InstallConfig &config;
    DecisionPresets presets;
};

// Asks on the terminal. Re-prompts until an answer is acceptable; password
// strength is enforced here rather than merely reported.
class ConsolePrompter : public DecisionSource {
public:
    ConsolePrompter(const InstallConfig &config, const DecisionPresets &presets,
                    QTextStream &in, QTextStream &out);

    QString selectDisk(const QList<Disk> &candidates) override;
    bool confirmDestructive(const QString &message) override;
    std::optional<qint64> rootSize(qint64 available) override;
    QString adminPassword() override;
    QString consoleType() override;
    QString imageName(const QString &suggested) override;
    bool setAsDefault() override;
    bool migrateData() override;
    bool acceptUnsavedChanges() override;
    bool showsWelcome() const override { return true; }

private:
    QString ask(const QString &question, const QString &defaultAnswer = QString());
    bool askYesNo(const QString &question, bool defaultYes);
    QString askHidden(const QString &question);
    QString readAnswer();
    bool cannotAskAgain();

    const InstallConfig &config;
    DecisionPresets presets;
    QTextStream &in;
    QTextStream &out;
    bool inputClosed = false;
};

#endif // DECISIONSOURCE_H
