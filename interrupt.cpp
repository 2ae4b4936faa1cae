#include "interrupt.h"

#include <csignal>
#include <cstring>

static volatile std::sig_atomic_t interrupted = 0;
static struct sigaction previousInt;
static struct sigaction previousTerm;

static void onSignal(int)
{
    interrupted = 1;
}

InterruptHandler::InterruptHandler()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: plain blocking system calls return early with EINTR.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &previousInt);
    sigaction(SIGTERM, &sa, &previousTerm);
}

InterruptHandler::~InterruptHandler()
{
    sigaction(SIGINT, &previousInt, nullptr);
    sigaction(SIGTERM, &previousTerm, nullptr);
}

bool interruptRequested()
{
    return interrupted != 0;
}

void requestInterrupt()
{
    interrupted = 1;
}

void clearInterrupt()
{
    interrupted = 0;
}
