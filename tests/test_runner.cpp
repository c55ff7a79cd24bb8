// Test runner: runs every suite and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_device_identity {
    bool run_all_tests();
}

namespace test_simctl_parser {
    bool run_all_tests();
}

namespace test_emulator_parser {
    bool run_all_tests();
}

namespace test_error_mapper {
    bool run_all_tests();
}

namespace test_cancellation {
    bool run_all_tests();
}

namespace test_command_runner {
    bool run_all_tests();
}

namespace test_config {
    bool run_all_tests();
}

namespace test_simctl_adapter {
    bool run_all_tests();
}

namespace test_emulator_adapter {
    bool run_all_tests();
}

namespace test_device_aggregator {
    bool run_all_tests();
}

namespace test_device_repository {
    bool run_all_tests();
}

namespace test_mcp {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_device_identity", test_device_identity::run_all_tests},
        {"test_simctl_parser", test_simctl_parser::run_all_tests},
        {"test_emulator_parser", test_emulator_parser::run_all_tests},
        {"test_error_mapper", test_error_mapper::run_all_tests},
        {"test_cancellation", test_cancellation::run_all_tests},
        {"test_command_runner", test_command_runner::run_all_tests},
        {"test_config", test_config::run_all_tests},
        {"test_simctl_adapter", test_simctl_adapter::run_all_tests},
        {"test_emulator_adapter", test_emulator_adapter::run_all_tests},
        {"test_device_aggregator", test_device_aggregator::run_all_tests},
        {"test_device_repository", test_device_repository::run_all_tests},
        {"test_mcp", test_mcp::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== simdeck Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
