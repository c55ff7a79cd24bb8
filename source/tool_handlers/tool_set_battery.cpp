#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_set_battery(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    double level = 0.0;
    if (!tool_support::require_number(arguments, "level", "set_battery", level, error_result)) {
        return error_result;
    }
    if (std::isnan(level) || level < 0.0 || level > 100.0) {
        return tool_support::argument_error("set_battery", "level between 0 and 100");
    }
    bool charging = false;
    if (!tool_support::optional_bool(arguments, "charging", "set_battery", charging, error_result)) {
        return error_result;
    }

    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "set_battery", device, error_result)) {
        return error_result;
    }

    int rounded_level = static_cast<int>(std::lround(level));
    debug_log::log("set_battery " + std::to_string(rounded_level) + "% on '" + device.name + "'");
    devices::OperationResult outcome = context.repository.apply_battery(device, rounded_level, charging);
    if (!outcome.success) {
        return tool_support::device_error_result("set_battery", outcome.error);
    }

    return tool_support::success_result(
        "Battery of '" + device.name + "' set to " + std::to_string(rounded_level) + "%" +
            (charging ? " (charging)." : "."),
        {{"device_id", device.id}, {"level", rounded_level}, {"charging", charging}});
}

namespace tool_set_battery {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema = tool_support::device_id_schema();
    input_schema["properties"]["level"] = {{"type", "number"}, {"minimum", 0}, {"maximum", 100},
                                           {"description", "Battery level in percent."}};
    input_schema["properties"]["charging"] = {{"type", "boolean"}, {"description", "Whether the battery is charging."}};
    input_schema["required"] = json::array({"device_id", "level"});

    registry.register_tool({
        "set_battery",
        "Override the status bar battery level and charging state. iOS simulators only.",
        input_schema,
        [&context](const json &arguments) { return handle_set_battery(context, arguments); }
    });
}

} // namespace tool_set_battery
