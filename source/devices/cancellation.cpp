#include "devices/cancellation.hpp"

namespace devices {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (duration.count() <= 0) {
        return !cancelled_;
    }
    condition_.wait_for(lock, duration, [this]() { return cancelled_; });
    return !cancelled_;
}

PollResult poll_until(const PollSettings &settings,
                      CancellationToken &token,
                      bool sleep_first,
                      const std::function<CheckResult()> &check) {
    PollResult result;
    std::chrono::milliseconds interval(settings.interval_milliseconds);

    for (int attempt = 1; attempt <= settings.max_attempts; attempt++) {
        if (sleep_first && !token.sleep_for(interval)) {
            result.outcome = PollOutcome::Cancelled;
            return result;
        }
        if (token.is_cancelled()) {
            result.outcome = PollOutcome::Cancelled;
            return result;
        }

        result.attempts = attempt;
        CheckResult check_result = check();
        if (check_result.state == CheckState::Ready) {
            result.outcome = PollOutcome::Satisfied;
            return result;
        }
        if (check_result.state == CheckState::Failed) {
            result.outcome = PollOutcome::Failed;
            result.error = check_result.error;
            return result;
        }

        bool last_attempt = (attempt == settings.max_attempts);
        if (!sleep_first && !last_attempt && !token.sleep_for(interval)) {
            result.outcome = PollOutcome::Cancelled;
            return result;
        }
    }

    result.outcome = PollOutcome::Exhausted;
    return result;
}

} // namespace devices
