#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "devices/platform_adapter.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_list_simulator_options(tool_handlers::ToolContext &context, const json &arguments) {
    (void)arguments;
    if (context.simulators == nullptr) {
        return tool_support::device_error_result(
            "list_simulator_options", devices::adapter_support::unsupported_error(
                                          "simulator creation", devices::DevicePlatform::Simulator));
    }

    simctl::DeviceTypesResult types = context.simulators->list_device_types();
    if (!types.success) {
        return tool_support::device_error_result("list_simulator_options", types.error);
    }
    simctl::RuntimesResult runtimes = context.simulators->list_runtimes();
    if (!runtimes.success) {
        return tool_support::device_error_result("list_simulator_options", runtimes.error);
    }

    json type_array = json::array();
    for (const auto &type : types.device_types) {
        type_array.push_back({{"identifier", type.identifier},
                              {"name", type.name},
                              {"display_name", type.display_name}});
    }
    json runtime_array = json::array();
    for (const auto &runtime : runtimes.runtimes) {
        runtime_array.push_back({{"identifier", runtime.identifier},
                                 {"name", runtime.name},
                                 {"version", runtime.version},
                                 {"display_version", runtime.display_version}});
    }

    return tool_support::success_result(
        std::to_string(type_array.size()) + " device type(s), " + std::to_string(runtime_array.size()) +
            " available runtime(s).",
        {{"device_types", type_array}, {"runtimes", runtime_array}});
}

namespace tool_list_simulator_options {

void register_tool(mcp_tools::ToolRegistry &registry, tool_handlers::ToolContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    registry.register_tool({
        "list_simulator_options",
        "List the iOS device types and available runtimes that create_simulator accepts.",
        input_schema,
        [&context](const json &arguments) { return handle_list_simulator_options(context, arguments); }
    });
}

} // namespace tool_list_simulator_options
