#ifndef SIMDECK_TOOL_HANDLERS_HPP
#define SIMDECK_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "devices/cancellation.hpp"
#include "devices/device_repository.hpp"
#include "devices/simctl/simctl_adapter.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Everything a tool handler may touch. Outlives the registry.
struct ToolContext {
    devices::DeviceRepository &repository;
    // Creation options and create_simulator; nullptr disables those tools' work.
    simctl::SimctlAdapter *simulators;
    // Cancelled when the server shuts down; aborts in-flight poll waits.
    devices::CancellationToken &cancellation;
};

// Register all available tool handlers with the registry.
void register_all_tools(mcp_tools::ToolRegistry &registry, ToolContext &context);

} // namespace tool_handlers

#endif // SIMDECK_TOOL_HANDLERS_HPP
