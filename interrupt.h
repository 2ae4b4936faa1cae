#ifndef INTERRUPT_H
#define INTERRUPT_H

// SIGINT/SIGTERM only raise a flag; the workflows poll it between steps and
// while copying, then unwind through their cleanup.
class InterruptHandler {
public:
    InterruptHandler();
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler &) = delete;
    InterruptHandler &operator=(const InterruptHandler &) = delete;
};

bool interruptRequested();
void requestInterrupt();
void clearInterrupt();

#endif // INTERRUPT_H
