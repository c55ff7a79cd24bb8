#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_set_location(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    double latitude = 0.0;
    double longitude = 0.0;
    if (!tool_support::require_number(arguments, "latitude", "set_location", latitude, error_result) ||
        !tool_support::require_number(arguments, "longitude", "set_location", longitude, error_result)) {
        return error_result;
    }
    if (latitude < -90.0 || latitude > 90.0 || longitude < -180.0 || longitude > 180.0) {
        return tool_support::argument_error("set_location", "latitude in [-90, 90] and longitude in [-180, 180]");
    }

    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "set_location", device, error_result)) {
        return error_result;
    }

    devices::OperationResult outcome = context.repository.apply_location(device, latitude, longitude);
    if (!outcome.success) {
        return tool_support::device_error_result("set_location", outcome.error);
    }

    return tool_support::success_result(
        "Location of '" + device.name + "' set.",
        {{"device_id", device.id}, {"latitude", latitude}, {"longitude", longitude}});
}

namespace tool_set_location {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema = tool_support::device_id_schema();
    input_schema["properties"]["latitude"] = {{"type", "number"}, {"description", "Latitude in degrees."}};
    input_schema["properties"]["longitude"] = {{"type", "number"}, {"description", "Longitude in degrees."}};
    input_schema["required"] = json::array({"device_id", "latitude", "longitude"});

    registry.register_tool({
        "set_location",
        "Simulate a GPS location. iOS simulators only.",
        input_schema,
        [&context](const json &arguments) { return handle_set_location(context, arguments); }
    });
}

} // namespace tool_set_location
