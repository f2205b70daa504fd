#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Cooperative stop signal for one unit of work.
 * @details Work loops call checkpoint() between records or candidates; it throws
 *          Negator::ComputationTimeoutException once the deadline has passed or cancel()
 *          was requested. The token never interrupts a thread on its own.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds budget);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    bool expired() const;

    /**
     * @brief Throws when the token has expired; cheap between clock reads.
     * @param stage Short label included in the timeout message.
     * @throws Negator::ComputationTimeoutException
     */
    void checkpoint(const char* stage);

    /**
     * @brief Same as checkpoint() but only consults the clock every `stride` calls.
     */
    void checkpointEvery(size_t stride, const char* stage);

    std::chrono::milliseconds budget() const noexcept { return budget_; }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
    std::chrono::milliseconds budget_{0};
    size_t ticks_ = 0;
};

// Checks a possibly-absent token.
inline void checkpoint(CancellationToken* token, const char* stage) {
    if (token) token->checkpoint(stage);
}
