#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_boot_device(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "boot_device", device, error_result)) {
        return error_result;
    }

    debug_log::log("boot_device invoked for '" + device.name + "'");
    devices::OperationResult outcome = context.repository.boot(device, context.cancellation);
    if (!outcome.success) {
        return tool_support::device_error_result("boot_device", outcome.error);
    }

    return tool_support::success_result("Booted '" + device.name + "'.",
                                        {{"device_id", device.id}, {"name", device.name}});
}

namespace tool_boot_device {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    registry.register_tool({
        "boot_device",
        "Boot a device and wait until it is running. Returns once the platform reports it booted.",
        tool_support::device_id_schema(),
        [&context](const json &arguments) { return handle_boot_device(context, arguments); }
    });
}

} // namespace tool_boot_device
