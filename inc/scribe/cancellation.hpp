#ifndef SCRIBE_CANCELLATION_HPP
#define SCRIBE_CANCELLATION_HPP

#include <atomic>

namespace scribe {

// =============================================================================
// Cancellation Token (取消标志)
// =============================================================================
//
// Cooperative, coarse-grained cancellation. The SIGINT handler sets the
// process token; the batch loop and the engine abort callback poll it.
//

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }
    void reset() noexcept { cancelled_.store(false); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/// @brief Process-wide token set by the interrupt handler
CancellationToken& interruptToken();

/// @brief Route SIGINT and SIGTERM to interruptToken()
void installInterruptHandler();

}  // namespace scribe

#endif  // SCRIBE_CANCELLATION_HPP
