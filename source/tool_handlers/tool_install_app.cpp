#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_install_app(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    std::string artifact_path;
    if (!tool_support::require_string(arguments, "artifact_path", "install_app", artifact_path,
                                      error_result)) {
        return error_result;
    }

    devices::Device device;
    if (!tool_support::resolve_device(context, arguments, "install_app", device, error_result)) {
        return error_result;
    }

    debug_log::log("install_app " + artifact_path + " -> '" + device.name + "'");
    devices::DeviceResult installed =
        context.repository.install_app(device, artifact_path, context.cancellation);
    if (!installed.success) {
        return tool_support::device_error_result("install_app", installed.error);
    }

    return tool_support::success_result("Installed " + artifact_path + " on '" + installed.device.name + "'.",
                                        {{"device", devices::device_to_json(installed.device)}});
}

namespace tool_install_app {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema = tool_support::device_id_schema();
    input_schema["properties"]["artifact_path"] = {
        {"type", "string"},
        {"description", "Absolute path to the .app bundle (iOS) or .apk (Android)."}};
    input_schema["required"] = json::array({"device_id", "artifact_path"});

    registry.register_tool({
        "install_app",
        "Install an app onto a device. iOS simulators must already be booted; "
        "Android emulator templates are launched first.",
        input_schema,
        [&context](const json &arguments) { return handle_install_app(context, arguments); }
    });
}

} // namespace tool_install_app
