#ifndef SIMDECK_MCP_TOOLS_HPP
#define SIMDECK_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag, as per MCP spec).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Returns false (and keeps the first definition) when the name is taken.
    bool register_tool(const ToolDefinition &definition);

    // Build the response payload for tools/list.
    json build_tools_list_response() const;

    // Dispatch a tools/call request. Returns the result payload (content + isError).
    json dispatch_tool_call(const std::string &tool_name, const json &arguments) const;

    const std::vector<ToolDefinition> &tools() const;

private:
    std::vector<ToolDefinition> tools_;
};

// {"content": [{"type": "text", "text": message}], "isError": true}
json error_result(const std::string &message);

} // namespace mcp_tools

#endif // SIMDECK_MCP_TOOLS_HPP
