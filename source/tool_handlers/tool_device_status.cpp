#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_device_status(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "device_status", device, error_result)) {
        return error_result;
    }

    devices::StatusResult status = context.repository.status(device);
    if (!status.success) {
        return tool_support::device_error_result("device_status", status.error);
    }

    json payload;
    payload["device"] = devices::device_to_json(device);
    payload["status"] = devices::status_to_json(status.status);
    return tool_support::success_result(
        "'" + device.name + "' is " + devices::state_name(status.status.state) + ".", payload);
}

namespace tool_device_status {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    registry.register_tool({
        "device_status",
        "Query the current state of a device directly from its platform toolchain (not cached).",
        tool_support::device_id_schema(),
        [&context](const json &arguments) { return handle_device_status(context, arguments); }
    });
}

} // namespace tool_device_status
