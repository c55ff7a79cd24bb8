#ifndef SIMDECK_MCP_DISPATCH_HPP
#define SIMDECK_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message, const mcp_tools::ToolRegistry &registry);

// Parses raw text and dispatches it; malformed JSON yields a PARSE_ERROR response.
json dispatch_raw(const std::string &raw_message, const mcp_tools::ToolRegistry &registry);

} // namespace mcp_dispatch

#endif // SIMDECK_MCP_DISPATCH_HPP
