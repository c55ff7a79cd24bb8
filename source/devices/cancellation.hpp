#ifndef SIMDECK_CANCELLATION_HPP
#define SIMDECK_CANCELLATION_HPP

// Cancellable polling for state transitions. The toolchains offer no
// completion signal, so adapters poll at a fixed interval for a bounded number
// of attempts; waits between attempts can be aborted through a token.

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

#include "devices/device_error.hpp"

namespace devices {

class CancellationToken {
public:
    // Wakes every sleeper; all later sleeps return immediately.
    void cancel();

    bool is_cancelled() const;

    // Non-busy sleep. Returns false if the token was (or becomes) cancelled.
    bool sleep_for(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool cancelled_ = false;
};

struct PollSettings {
    int interval_milliseconds = 1000;
    int max_attempts = 20;
};

enum class CheckState {
    Ready,
    NotReady,
    Failed
};

struct CheckResult {
    CheckState state = CheckState::NotReady;
    DeviceError error;
};

enum class PollOutcome {
    Satisfied,
    Exhausted,
    Cancelled,
    Failed
};

struct PollResult {
    PollOutcome outcome = PollOutcome::Exhausted;
    int attempts = 0;
    DeviceError error; // set for Failed
};

inline CheckResult check_ready() {
    CheckResult result;
    result.state = CheckState::Ready;
    return result;
}

inline CheckResult check_not_ready() {
    return CheckResult();
}

inline CheckResult check_failed(const DeviceError &error) {
    CheckResult result;
    result.state = CheckState::Failed;
    result.error = error;
    return result;
}

// Runs check up to settings.max_attempts times with settings.interval_milliseconds
// between attempts. With sleep_first the interval also precedes the first check.
PollResult poll_until(const PollSettings &settings,
                      CancellationToken &token,
                      bool sleep_first,
                      const std::function<CheckResult()> &check);

} // namespace devices

#endif // SIMDECK_CANCELLATION_HPP
