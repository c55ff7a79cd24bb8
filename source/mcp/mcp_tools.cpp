#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

namespace mcp_tools {

bool ToolRegistry::register_tool(const ToolDefinition &definition) {
    for (const auto &tool : tools_) {
        if (tool.name == definition.name) {
            debug_log::warn("tool '" + definition.name + "' registered twice, keeping the first");
            return false;
        }
    }
    tools_.push_back(definition);
    return true;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json ToolRegistry::dispatch_tool_call(const std::string &tool_name, const json &arguments) const {
    for (const auto &tool : tools_) {
        if (tool.name != tool_name) {
            continue;
        }
        try {
            return tool.handler(arguments);
        } catch (const json::exception &error) {
            // Argument access with the wrong JSON type.
            debug_log::warn("tool '" + tool_name + "' rejected its arguments: " + error.what());
            return error_result(tool_name + ": invalid arguments: " + error.what());
        }
    }

    return error_result("Unknown tool: " + tool_name);
}

const std::vector<ToolDefinition> &ToolRegistry::tools() const {
    return tools_;
}

json error_result(const std::string &message) {
    json error_content;
    error_content["type"] = "text";
    error_content["text"] = message;

    json result;
    result["content"] = json::array({error_content});
    result["isError"] = true;
    return result;
}

} // namespace mcp_tools
