/**
 * @file cancellation.hpp
 * @brief Cancellation tokens and bounded retry for adapter calls
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_CANCELLATION_HPP
#define TIERGUARD_CANCELLATION_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include <mutex>
#include <condition_variable>
#include <memory>
#include <algorithm>

namespace tierguard {

/**
 * @class CancellationToken
 * @brief Shared cancel flag with an optional deadline
 *
 * Copies share state: cancelling one copy cancels all of them. A default
 * constructed token never expires.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken withTimeout(Millis timeout) {
        CancellationToken t;
        t.state_->deadline = std::chrono::steady_clock::now() + timeout;
        return t;
    }

    void cancel() {
        { std::lock_guard<std::mutex> lock(state_->mtx); state_->cancelled = true; }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->cancelled;
    }

    [[nodiscard]] bool isExpired() const {
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->deadline && std::chrono::steady_clock::now() >= *state_->deadline;
    }

    /// Ok while the operation may continue; CANCELLED or ADAPTER_TIMEOUT otherwise
    [[nodiscard]] Result<void> check() const {
        if (isCancelled()) return Err(ErrorCode::CANCELLED, "operation cancelled");
        if (isExpired()) return Err(ErrorCode::ADAPTER_TIMEOUT, "deadline exceeded");
        return Ok();
    }

    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> deadline() const {
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->deadline;
    }

    /// Time left before the deadline, or std::nullopt when unbounded
    [[nodiscard]] std::optional<Millis> remaining() const {
        std::lock_guard<std::mutex> lock(state_->mtx);
        if (!state_->deadline) return std::nullopt;
        auto left = std::chrono::duration_cast<Millis>(*state_->deadline - std::chrono::steady_clock::now());
        return std::max(left, Millis(0));
    }

    /**
     * @brief Sleep for up to @p d, waking early on cancel or deadline
     * @return false if woken by cancellation or deadline
     */
    bool waitFor(Millis d) const {
        std::unique_lock<std::mutex> lock(state_->mtx);
        auto until = std::chrono::steady_clock::now() + d;
        if (state_->deadline && *state_->deadline < until) until = *state_->deadline;
        state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
        if (state_->cancelled) return false;
        return !(state_->deadline && std::chrono::steady_clock::now() >= *state_->deadline);
    }

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        bool cancelled = false;
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };
    std::shared_ptr<State> state_;
};

/**
 * @struct RetryPolicy
 * @brief Bounded exponential backoff for transient adapter failures
 */
struct RetryPolicy {
    uint32_t max_attempts = 3;      ///< Total attempts including the first
    Millis base_delay{50};          ///< Delay before the second attempt
    double multiplier = 2.0;        ///< Growth per further attempt
    Millis max_delay{2000};         ///< Cap on a single delay

    /// Delay to wait after the given (1-based) failed attempt
    [[nodiscard]] Millis delayAfter(uint32_t attempt) const {
        double d = static_cast<double>(base_delay.count());
        for (uint32_t i = 1; i < attempt; ++i) d *= multiplier;
        auto capped = std::min(d, static_cast<double>(max_delay.count()));
        return Millis(static_cast<int64_t>(capped));
    }

    [[nodiscard]] bool isValid() const {
        return max_attempts >= 1 && base_delay.count() >= 0 && multiplier >= 1.0 &&
               max_delay >= base_delay;
    }

    static RetryPolicy none() { return RetryPolicy{1, Millis(0), 1.0, Millis(0)}; }
};

/**
 * @brief Run @p op until it succeeds, fails permanently, or attempts run out
 *
 * Only errors reporting isRetryable() are retried. The token bounds both the
 * calls and the sleeps between them.
 */
template<typename T, typename Op>
Result<T> withRetry(const RetryPolicy& policy, const CancellationToken& token, Op&& op,
                    uint32_t* attempts_out = nullptr) {
    uint32_t attempt = 0;
    while (true) {
        auto gate = token.check();
        if (!gate) { if (attempts_out) *attempts_out = attempt; return Err<T>(gate.error()); }
        ++attempt;
        Result<T> r = op();
        if (r.isOk() || !r.error().isRetryable() || attempt >= policy.max_attempts) {
            if (attempts_out) *attempts_out = attempt;
            return r;
        }
        if (!token.waitFor(policy.delayAfter(attempt))) {
            if (attempts_out) *attempts_out = attempt;
            auto why = token.check();
            return why ? r : Err<T>(why.error());
        }
    }
}

} // namespace tierguard
#endif
