#include "addimageworkflow.h"
#include "bootloader.h"
#include "commandline.h"
#include "commandrunner.h"
#include "decisionsource.h"
#include "diskinventory.h"
#include "diskoperations.h"
#include "downloader.h"
#include "imageintegrity.h"
#include "installconfig.h"
#include "installworkflow.h"
#include "interrupt.h"
#include "logging.h"
#include "passwordhasher.h"
#include "systemprobe.h"
#include "unsavedchanges.h"
#include "versionreader.h"

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <cstdio>
#include <memory>

// Routes a workflow's signals to the console message handler.
template <typename Workflow>
static void connectReporting(Workflow &workflow)
{
    QObject::connect(&workflow, &Workflow::logMessage,
                     [](const QString &msg) { qInfo().noquote() << msg; });
    QObject::connect(&workflow, &Workflow::warningIssued,
                     [](const QString &msg) { qWarning().noquote() << msg; });
    QObject::connect(&workflow, &Workflow::errorOccurred,
                     [](const QString &msg) { qCritical().noquote() << msg; });
}

template <typename Workflow>
static int finish(Workflow &workflow, bool succeeded, const InstallConfig &config)
{
    if (succeeded)
        return 0;
    const Failure &failure = workflow.failure();
    if (failure.kind == FailureKind::Interrupt)
        qInfo().noquote() << config.messages.infoInterrupted;
    return exitCodeFor(failure);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("image-installer");

    const ParseResult parsed = parseCommandLine(QCoreApplication::arguments());
    if (parsed.helpRequested) {
        fputs(qPrintable(parsed.helpText), stdout);
        return 0;
    }
    if (!parsed.options) {
        fprintf(stderr, "%s\n", qPrintable(parsed.error));
        fprintf(stderr, "Try '%s --help' for more information.\n", qPrintable(QCoreApplication::applicationName()));
        return 2;
    }
    const CommandLineOptions &options = *parsed.options;

    installMessageHandler(options.verbose);

    if (!runningAsRoot()) {
        qCritical() << "This is a privileged tool, run it as root.";
        return 1;
    }

    const InstallConfig config = InstallConfig::load(options.configFile);
    InterruptHandler interrupts;

    ProcessCommandRunner runner;
    DiskInventory inventory(config, runner);
    SystemDiskOperations disks(runner);
    GrubBootloader bootloader(config, runner);
    MkpasswdHasher hasher(runner);
    NetworkDownloader downloader(runner);
    FileVersionReader versions(config);
    HostSystemProbe probe(config);
    ConfigSessionChecker unsaved(config, runner);
    MinisignVerifier signatures(config, runner);

    QTextStream in(stdin);
    QTextStream out(stdout);
    std::unique_ptr<DecisionSource> decisions;
    if (options.noPrompt)
        decisions.reset(new NonInteractiveDecisions(config, options.presets));
    else
        decisions.reset(new ConsolePrompter(config, options.presets, in, out));

    const Collaborators deps{inventory, disks, bootloader, hasher, downloader,
                             versions, probe, unsaved, signatures, *decisions};

    if (options.action == Action::Install) {
        InstallWorkflow workflow(config, deps);
        connectReporting(workflow);
        const bool ok = workflow.run();
        return finish(workflow, ok, config);
    }

    AddImageRequest request;
    request.imagePath = options.imagePath;
    request.vrf = options.vrf;
    request.username = options.username;
    request.password = options.password;
    request.force = options.force;

    AddImageWorkflow workflow(config, deps, request);
    connectReporting(workflow);
    const bool ok = workflow.run();
    return finish(workflow, ok, config);
}
