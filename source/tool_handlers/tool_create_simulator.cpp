#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "devices/platform_adapter.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_create_simulator(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    std::string name;
    std::string device_type_id;
    std::string runtime_id;
    if (!tool_support::require_string(arguments, "name", "create_simulator", name, error_result) ||
        !tool_support::require_string(arguments, "device_type_id", "create_simulator", device_type_id,
                                      error_result) ||
        !tool_support::require_string(arguments, "runtime_id", "create_simulator", runtime_id,
                                      error_result)) {
        return error_result;
    }

    if (context.simulators == nullptr) {
        return tool_support::device_error_result(
            "create_simulator", devices::adapter_support::unsupported_error(
                                    "simulator creation", devices::DevicePlatform::Simulator));
    }

    simctl::CreateResult created = context.simulators->create_simulator(name, device_type_id, runtime_id);
    if (!created.success) {
        return tool_support::device_error_result("create_simulator", created.error);
    }
    context.repository.invalidate();

    json payload;
    payload["udid"] = created.udid;
    payload["device_id"] = devices::make_device(devices::DevicePlatform::Simulator, created.udid, name,
                                                created.udid, devices::DeviceState::Shutdown).id;
    payload["name"] = name;
    return tool_support::success_result("Created simulator '" + name + "' (" + created.udid + ").", payload);
}

namespace tool_create_simulator {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"name", {{"type", "string"}, {"description", "Name of the new simulator."}}},
        {"device_type_id", {{"type", "string"}, {"description", "Device type identifier from list_simulator_options."}}},
        {"runtime_id", {{"type", "string"}, {"description", "Runtime identifier from list_simulator_options."}}}
    };
    input_schema["required"] = json::array({"name", "device_type_id", "runtime_id"});

    registry.register_tool({
        "create_simulator",
        "Create a new iOS simulator from a device type and runtime.",
        input_schema,
        [&context](const json &arguments) { return handle_create_simulator(context, arguments); }
    });
}

} // namespace tool_create_simulator
