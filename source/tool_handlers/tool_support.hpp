#ifndef SIMDECK_TOOL_SUPPORT_HPP
#define SIMDECK_TOOL_SUPPORT_HPP

// Helpers shared by the tool handlers: argument checks and MCP result payloads.
// A result carries a human summary in content[0] and, on success, the
// structured payload as JSON text in content[1].

#include <nlohmann/json.hpp>
#include <string>

#include "devices/device_error.hpp"
#include "tool_handlers/tool_handlers.hpp"

namespace tool_support {

using json = nlohmann::json;

json success_result(const std::string &summary, const json &payload);

// "<kind>: <description>" plus the recovery suggestion; content[1] holds the error fields.
json device_error_result(const std::string &tool_name, const devices::DeviceError &error);

// Argument problems: "<tool> requires ...".
json argument_error(const std::string &tool_name, const std::string &requirement);

// Each returns false and fills out_error_result when the argument is missing or mistyped.
bool require_string(const json &arguments, const std::string &key, const std::string &tool_name,
                    std::string &out_value, json &out_error_result);
bool require_number(const json &arguments, const std::string &key, const std::string &tool_name,
                    double &out_value, json &out_error_result);
bool optional_bool(const json &arguments, const std::string &key, const std::string &tool_name,
                   bool &out_value, json &out_error_result);

// Reads "device_id" and resolves it through the repository.
bool resolve_device(tool_handlers::ToolContext &context, const json &arguments,
                    const std::string &tool_name, devices::Device &out_device,
                    json &out_error_result);

// Input schema fragment for a tool that only takes device_id.
json device_id_schema();

} // namespace tool_support

#endif // SIMDECK_TOOL_SUPPORT_HPP
