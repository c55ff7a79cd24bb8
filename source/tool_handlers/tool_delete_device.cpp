#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_delete_device(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "delete_device", device, error_result)) {
        return error_result;
    }

    debug_log::log("delete_device invoked for '" + device.name + "'");
    devices::OperationResult outcome = context.repository.remove(device, context.cancellation);
    if (!outcome.success) {
        return tool_support::device_error_result("delete_device", outcome.error);
    }

    return tool_support::success_result("Deleted '" + device.name + "'.",
                                        {{"device_id", device.id}, {"name", device.name}});
}

namespace tool_delete_device {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    registry.register_tool({
        "delete_device",
        "Delete a device definition. Running devices are shut down first.",
        tool_support::device_id_schema(),
        [&context](const json &arguments) { return handle_delete_device(context, arguments); }
    });
}

} // namespace tool_delete_device
