#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <string>

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

static const std::string SERVER_NAME = "simdeck";
static const std::string SERVER_VERSION = "0.1.0";
// Lets MCP clients tell what this server is for.
static const std::string SERVER_DESCRIPTION =
    "Virtual device MCP server: lists, boots, shuts down, restarts and deletes "
    "iOS simulators (xcrun simctl) and Android emulators (adb/emulator), installs "
    "apps onto them and simulates battery and location. Tools include "
    "list_devices, boot_device, install_app and device_status.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        debug_log::log("client protocol version " + params["protocolVersion"].get<std::string>());
    }

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_call(const json &request_id, const json &params,
                              const mcp_tools::ToolRegistry &registry) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    debug_log::log("tools/call " + tool_name + " " + arguments.dump());
    json tool_result = registry.dispatch_tool_call(tool_name, arguments);
    return json_rpc::build_response(request_id, tool_result);
}

json dispatch_message(const json &message, const mcp_tools::ToolRegistry &registry) {
    std::string validation_error;
    if (!json_rpc::validate_message(message, validation_error)) {
        return json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INVALID_REQUEST,
                                               validation_error);
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // notifications/initialized and notifications/cancelled need no answer.
    if (json_rpc::is_notification(message)) {
        debug_log::log("notification " + method);
        return nullptr;
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return json_rpc::build_response(request_id, registry.build_tools_list_response());
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params, registry);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

json dispatch_raw(const std::string &raw_message, const mcp_tools::ToolRegistry &registry) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        debug_log::warn("Failed to parse incoming JSON: " + std::string(error.what()));
        return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error",
                                               std::string(error.what()));
    }
    return dispatch_message(parsed_message, registry);
}

} // namespace mcp_dispatch
