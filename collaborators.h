#ifndef COLLABORATORS_H
#define COLLABORATORS_H

class BootloaderIntegrator;
class DecisionSource;
class DiskInventory;
class DiskOperations;
class Downloader;
class PasswordHasher;
class SignatureVerifier;
class SystemProbe;
class UnsavedChangesChecker;
class VersionReader;

// What a workflow talks to. main() wires the real implementations; tests wire
// mocks. None of these is owned by the workflow.
struct Collaborators {
    DiskInventory &inventory;
    DiskOperations &disks;
    BootloaderIntegrator &bootloader;
    PasswordHasher &hasher;
    Downloader &downloader;
    VersionReader &versions;
    SystemProbe &probe;
    UnsavedChangesChecker &unsaved;
    SignatureVerifier &signatures;
    DecisionSource &decisions;
};

#endif // COLLABORATORS_H
