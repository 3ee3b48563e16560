#pragma once

#include "photo_pairing/types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace photo_pairing::report {

    /**
     * @brief Cooperative stop signal for a report build
     *
     * Copies share state: cancelling any copy stops every holder. A token
     * may also carry a deadline, after which shouldStop() is true.
     */
    class CancellationToken {
    public:
        using Clock = std::chrono::steady_clock;

        CancellationToken() : state_(std::make_shared<State>()) {}

        static CancellationToken withTimeout(std::chrono::milliseconds timeout) {
            CancellationToken token;
            token.state_->deadline = Clock::now() + timeout;
            return token;
        }

        void cancel() const {
            state_->cancelled.store(true);
        }

        bool isCancelled() const {
            return state_->cancelled.load();
        }

        bool deadlineExpired() const {
            return state_->deadline.has_value() && Clock::now() >= *state_->deadline;
        }

        bool shouldStop() const {
            return isCancelled() || deadlineExpired();
        }

        /// CANCELLED or TIMED_OUT once the build must stop; explicit cancel wins.
        std::optional<ReportStatus> stopReason() const {
            if (isCancelled()) return ReportStatus::CANCELLED;
            if (deadlineExpired()) return ReportStatus::TIMED_OUT;
            return std::nullopt;
        }

    private:
        struct State {
            std::atomic<bool> cancelled{false};
            std::optional<Clock::time_point> deadline;
        };

        std::shared_ptr<State> state_;
    };

} // namespace photo_pairing::report
