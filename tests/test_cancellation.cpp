// Tests for poll_until and CancellationToken.

#include <chrono>
#include <thread>

#include "devices/cancellation.hpp"
#include "test_support.hpp"

using test_support::expect;
using devices::CheckResult;
using devices::PollOutcome;

namespace test_cancellation {

static bool test_satisfied_after_attempts() {
    devices::CancellationToken token;
    int calls = 0;
    devices::PollResult result = devices::poll_until({0, 5}, token, false, [&]() -> CheckResult {
        calls++;
        return calls == 3 ? devices::check_ready() : devices::check_not_ready();
    });
    return expect(result.outcome == PollOutcome::Satisfied && result.attempts == 3 && calls == 3,
                  "Poll stops at the first ready check");
}

static bool test_exhausted() {
    devices::CancellationToken token;
    int calls = 0;
    devices::PollResult result = devices::poll_until({0, 4}, token, true, [&]() {
        calls++;
        return devices::check_not_ready();
    });
    return expect(result.outcome == PollOutcome::Exhausted && calls == 4,
                  "Poll gives up after exactly max_attempts checks");
}

static bool test_failed_check() {
    devices::CancellationToken token;
    devices::PollResult result = devices::poll_until({0, 10}, token, false, []() {
        return devices::check_failed(devices::make_error(devices::ErrorKind::DeviceNotFound, "gone"));
    });
    return expect(result.outcome == PollOutcome::Failed &&
                      result.error.kind == devices::ErrorKind::DeviceNotFound && result.attempts == 1,
                  "A failed check ends the poll with its error");
}

static bool test_cancel_wakes_sleeper() {
    devices::CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    int calls = 0;
    devices::PollResult result = devices::poll_until({10000, 10}, token, true, [&]() {
        calls++;
        return devices::check_not_ready();
    });
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();
    return expect(result.outcome == PollOutcome::Cancelled && calls == 0 &&
                      elapsed < std::chrono::seconds(5),
                  "Cancelling the token interrupts a long interval");
}

static bool test_cancelled_token_stays_cancelled() {
    devices::CancellationToken token;
    token.cancel();
    bool slept = token.sleep_for(std::chrono::milliseconds(1000));
    return expect(!slept && token.is_cancelled(), "Sleeps on a cancelled token return at once");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_satisfied_after_attempts();
    all_passed &= test_exhausted();
    all_passed &= test_failed_check();
    all_passed &= test_cancel_wakes_sleeper();
    all_passed &= test_cancelled_token_stays_cancelled();
    return all_passed;
}

} // namespace test_cancellation
