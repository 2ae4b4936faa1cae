#include "commandline.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <cmath>

ParseResult parseCommandLine(const QStringList &arguments)
{
    ParseResult result;

    QCommandLineParser parser;
    parser.setApplicationDescription("Install a VyOS image onto a disk, or add an image to an installed system.");
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    parser.addHelpOption();

    const QCommandLineOption actionOpt("action", "Workflow to run: install or add.", "action");
    const QCommandLineOption noPromptOpt("no-prompt", "Do not ask questions; use defaults and the given values.");
    const QCommandLineOption imagePathOpt("image-path", "Image to add: a local file or a URL.", "path");
    const QCommandLineOption vrfOpt("vrf", "VRF to download the image through.", "vrf");
    const QCommandLineOption usernameOpt("username", "User name for the download.", "username");
    const QCommandLineOption passwordOpt("password", "Password for the download.", "password");
    const QCommandLineOption forceOpt("force", "Accept an image of a different flavor.");
    const QCommandLineOption targetDiskOpt("target-disk", "Disk to install onto, e.g. /dev/sda.", "disk");
    const QCommandLineOption vyosPasswordOpt("vyos-password", "Password of the initial \"vyos\" user.", "password");
    const QCommandLineOption rootSizeOpt("root-size-gb", "Size of the root partition in GB.", "size");
    const QCommandLineOption imageNameOpt("image-name", "Name of the new image.", "name");
    const QCommandLineOption noSetDefaultOpt("no-set-default", "Keep the current default boot image.");
    const QCommandLineOption consoleTypeOpt("console-type", "Default console: kvm or serial.", "type", "kvm");
    const QCommandLineOption configOpt("config", "Settings file.", "file", "/etc/image-installer.conf");
    const QCommandLineOption verboseOpt("verbose", "Print debug output.");

    parser.addOptions({actionOpt, noPromptOpt, imagePathOpt, vrfOpt, usernameOpt, passwordOpt,
                       forceOpt, targetDiskOpt, vyosPasswordOpt, rootSizeOpt, imageNameOpt,
                       noSetDefaultOpt, consoleTypeOpt, configOpt, verboseOpt});

    if (!parser.parse(arguments)) {
        result.error = parser.errorText();
        return result;
    }
    if (parser.isSet("help")) {
        result.helpRequested = true;
        result.helpText = parser.helpText();
        return result;
    }
    if (!parser.positionalArguments().isEmpty()) {
        result.error = "Unexpected argument: " + parser.positionalArguments().first();
        return result;
    }

    CommandLineOptions options;

    const QString action = parser.value(actionOpt);
    if (action == "install") {
        options.action = Action::Install;
    } else if (action == "add") {
        options.action = Action::Add;
    } else if (action.isEmpty()) {
        result.error = "Missing required option: --action {install,add}";
        return result;
    } else {
        result.error = QString("Unknown action \"%1\", expected install or add").arg(action);
        return result;
    }

    options.noPrompt = parser.isSet(noPromptOpt) || options.action == Action::Install;
    options.force = parser.isSet(forceOpt);
    options.verbose = parser.isSet(verboseOpt);
    options.configFile = parser.value(configOpt);

    options.imagePath = parser.value(imagePathOpt);
    options.vrf = parser.value(vrfOpt);
    options.username = parser.value(usernameOpt);
    options.password = parser.value(passwordOpt);
    if (options.action == Action::Add && options.imagePath.isEmpty()) {
        result.error = "The add action requires --image-path";
        return result;
    }

    DecisionPresets &presets = options.presets;
    presets.targetDisk = parser.value(targetDiskOpt);
    if (parser.isSet(vyosPasswordOpt))
        presets.adminPassword = parser.value(vyosPasswordOpt);
    if (parser.isSet(rootSizeOpt)) {
        bool ok = false;
        const double size = parser.value(rootSizeOpt).toDouble(&ok);
        if (!ok || !std::isfinite(size) || size <= 0) {
            result.error = "--root-size-gb must be a positive number";
            return result;
        }
        presets.rootSizeGb = size;
    }
    presets.imageName = parser.value(imageNameOpt);
    presets.setDefault = !parser.isSet(noSetDefaultOpt);
    // Validated by the install workflow, which falls back to kvm with a warning.
    presets.consoleType = parser.value(consoleTypeOpt);

    result.options = options;
    return result;
}
