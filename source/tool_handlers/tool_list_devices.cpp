#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_list_devices(tool_handlers::ToolContext &context, const json &arguments) {
    json error_result;
    bool force_refresh = false;
    if (!tool_support::optional_bool(arguments, "force_refresh", "list_devices", force_refresh,
                                     error_result)) {
        return error_result;
    }

    bool filter_platform = false;
    devices::DevicePlatform wanted_platform = devices::DevicePlatform::Simulator;
    if (arguments.contains("platform") && !arguments["platform"].is_null()) {
        if (!arguments["platform"].is_string() ||
            !devices::parse_platform(arguments["platform"].get<std::string>(), wanted_platform)) {
            return tool_support::argument_error("list_devices", "platform \"ios\" or \"android\" (when given)");
        }
        filter_platform = true;
    }

    devices::DeviceListResult listing = context.repository.fetch_devices(force_refresh);
    if (!listing.success) {
        return tool_support::device_error_result("list_devices", listing.error);
    }

    json device_array = json::array();
    for (const auto &device : listing.devices) {
        if (filter_platform && device.platform != wanted_platform) {
            continue;
        }
        device_array.push_back(devices::device_to_json(device));
    }

    json failure_array = json::array();
    std::string summary = std::to_string(device_array.size()) + " device(s).";
    for (const auto &failure : listing.platform_failures) {
        if (filter_platform && failure.platform != wanted_platform) {
            continue;
        }
        failure_array.push_back({{"platform", devices::platform_name(failure.platform)},
                                 {"kind", devices::kind_name(failure.error.kind)},
                                 {"message", devices::describe(failure.error)}});
        summary += " " + devices::platform_name(failure.platform) +
                   " listing failed: " + devices::describe(failure.error);
    }

    debug_log::log("list_devices returned " + std::to_string(device_array.size()) + " devices");
    return tool_support::success_result(summary, {{"devices", device_array},
                                                  {"platform_failures", failure_array}});
}

namespace tool_list_devices {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"force_refresh", {{"type", "boolean"}, {"description", "Bypass the short-lived device list cache."}}},
        {"platform", {{"type", "string"}, {"enum", {"ios", "android"}}, {"description", "Only list devices of this platform."}}}
    };

    registry.register_tool({
        "list_devices",
        "List iOS simulators and Android emulators (running instances and templates) with their state. "
        "Partial results are returned when one platform's toolchain fails.",
        input_schema,
        [&context](const json &arguments) { return handle_list_devices(context, arguments); }
    });
}

} // namespace tool_list_devices
