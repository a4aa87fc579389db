#include "scribe/cancellation.hpp"

#include <csignal>

namespace scribe {

namespace {

CancellationToken g_interrupt_token;

void onInterruptSignal(int /*signum*/) {
    // Only lock-free atomics are touched here
    g_interrupt_token.cancel();
}

}  // namespace

CancellationToken& interruptToken() {
    return g_interrupt_token;
}

void installInterruptHandler() {
    std::signal(SIGINT, onInterruptSignal);
    std::signal(SIGTERM, onInterruptSignal);
}

}  // namespace scribe
