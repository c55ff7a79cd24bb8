// simdeck – virtual device MCP server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (permitted by MCP spec).

#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

#include "command/command_runner.hpp"
#include "config/config.hpp"
#include "devices/device_aggregator.hpp"
#include "devices/device_repository.hpp"
#include "devices/emulator/emulator_adapter.hpp"
#include "devices/simctl/simctl_adapter.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

static std::atomic<bool> shutdown_requested(false);

// SIGINT/SIGTERM are blocked in every thread and collected here, so the
// handler may take locks: it cancels in-flight waits and wakes the stdin
// reader to end the read loop.
static void watch_signals(sigset_t signal_set, devices::CancellationToken *cancellation,
                          mcp_stdio::InterruptibleReader *input_reader) {
    int signal_number = 0;
    if (sigwait(&signal_set, &signal_number) != 0) {
        return;
    }
    debug_log::log("signal " + std::to_string(signal_number) + " received");
    shutdown_requested = true;
    cancellation->cancel();
    input_reader->interrupt();
}

int main() {
    std::cerr << "[simdeck] simdeck – virtual device MCP server, build " << __DATE__ << " " << __TIME__ << std::endl;

    config::LoadResult loaded = config::load_config();
    if (!loaded.success) {
        mcp_stdio::log_message("Configuration error: " + loaded.error_message);
        return 1;
    }
    if (!loaded.source_path.empty()) {
        mcp_stdio::log_message("Loaded configuration from " + loaded.source_path);
    }
    const config::SimdeckConfig &settings = loaded.config;
    debug_log::log("effective configuration: " + config::config_to_json(settings).dump());

    sigset_t signal_set;
    sigemptyset(&signal_set);
    sigaddset(&signal_set, SIGINT);
    sigaddset(&signal_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signal_set, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    mcp_stdio::InterruptibleReader input_reader(STDIN_FILENO);
    if (!input_reader.can_interrupt()) {
        debug_log::warn("could not create the stdin wake pipe; signals end the server only between messages");
    }
    std::istream input(&input_reader);

    devices::CancellationToken cancellation;
    std::thread signal_thread(watch_signals, signal_set, &cancellation, &input_reader);
    signal_thread.detach();

    command_runner::ProcessRunner runner;
    simctl::SimctlAdapter simulators(runner, simctl::make_simctl_settings(settings));
    emulator::EmulatorAdapter emulators(runner, emulator::make_emulator_settings(settings));
    devices::DeviceAggregator aggregator({&simulators, &emulators});
    devices::DeviceRepository repository(aggregator, settings.cache_validity_ms);
    repository.add_change_listener([]() { debug_log::log("device list invalidated"); });

    mcp_tools::ToolRegistry registry;
    tool_handlers::ToolContext context{repository, &simulators, cancellation};
    tool_handlers::register_all_tools(registry, context);

    mcp_stdio::log_message("simdeck started with " + std::to_string(registry.tools().size()) +
                           " tools. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message(input);

        if (raw_message.empty()) {
            if (input_reader.interrupted()) {
                mcp_stdio::log_message("Signal received. Shutting down.");
            } else {
                // EOF on stdin means the client disconnected.
                mcp_stdio::log_message("EOF on stdin. Shutting down.");
            }
            break;
        }

        json response = mcp_dispatch::dispatch_raw(raw_message, registry);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(std::cout, response.dump());
    }

    // Emulators launched by boot_device are detached and keep running.
    mcp_stdio::log_message("simdeck shut down.");
    return 0;
}
