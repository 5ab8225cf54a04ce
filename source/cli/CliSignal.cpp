#include "CliSignal.h"

#include <QDebug>

#include <csignal>

/**
 * @file CliSignal.cpp
 * @brief sigaction() based stop flag.
 */

namespace Cli {

static std::atomic<bool> g_stop(false);

// Written only from the handler; 0 until a signal arrives
static volatile std::sig_atomic_t g_stopSignal = 0;

// Async-signal-safe: two stores, no I/O. The handler reports the stop
// after the interrupted operation has returned.
static void onStopSignal(int signal)
{
    g_stopSignal = signal;
    g_stop.store(true);
}

void installSignalHandlers()
{
    struct sigaction sa;
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART so blocking reads return early; SA_RESETHAND so a
    // second Ctrl+C terminates instead of waiting for the page loop.
    sa.sa_flags = SA_RESETHAND;

    for (int signal : {SIGINT, SIGTERM}) {
        if (sigaction(signal, &sa, nullptr) != 0) {
            qWarning() << "[CliSignal] Could not install handler for signal" << signal;
        }
    }
}

std::atomic<bool>* stopFlag()
{
    return &g_stop;
}

bool stopRequested()
{
    return g_stop.load();
}

QString stopSignalName()
{
    switch (g_stopSignal) {
        case SIGINT:  return QStringLiteral("SIGINT");
        case SIGTERM: return QStringLiteral("SIGTERM");
        case 0:       return QString();
    }
    return QStringLiteral("signal %1").arg(static_cast<int>(g_stopSignal));
}

} // namespace Cli
