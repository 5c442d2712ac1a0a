/**
 * @file context.h
 * @brief Cancellation signal passed to every network operation
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_CONTEXT_H
#define NEOLOAD_CONTEXT_H

#include <atomic>
#include <chrono>
#include <optional>

namespace neoload {

/**
 * @brief Cooperative cancellation flag with optional deadline
 *
 * One context per invocation. Cancel() may be called from any thread;
 * the engine and store implementations poll IsCancelled() between steps.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    /**
     * @brief Context that expires timeout after construction
     */
    explicit Context(std::chrono::milliseconds timeout)
        : deadline_(Clock::now() + timeout) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool IsCancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    const std::optional<Clock::time_point>& Deadline() const noexcept { return deadline_; }

    /**
     * @brief Throw CancellationError naming the stage if cancelled
     */
    void ThrowIfCancelled(const char* stage) const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace neoload

#endif // NEOLOAD_CONTEXT_H
