#include "tool_handlers/tool_support.hpp"

namespace tool_support {

static json text_block(const std::string &text) {
    json block;
    block["type"] = "text";
    block["text"] = text;
    return block;
}

json success_result(const std::string &summary, const json &payload) {
    json result;
    result["content"] = json::array({text_block(summary), text_block(payload.dump(2))});
    result["isError"] = false;
    return result;
}

json device_error_result(const std::string &tool_name, const devices::DeviceError &error) {
    json details;
    details["kind"] = devices::kind_name(error.kind);
    details["message"] = error.message;
    details["operation"] = error.operation;
    details["underlying"] = error.underlying;
    details["suggestion"] = devices::recovery_suggestion(error.kind);

    std::string text = tool_name + " failed: " + devices::kind_name(error.kind) + ": " +
                       devices::describe(error) + "\nSuggestion: " +
                       devices::recovery_suggestion(error.kind);

    json result;
    result["content"] = json::array({text_block(text), text_block(json{{"error", details}}.dump(2))});
    result["isError"] = true;
    return result;
}

json argument_error(const std::string &tool_name, const std::string &requirement) {
    json result;
    result["content"] = json::array({text_block(tool_name + " requires " + requirement + ".")});
    result["isError"] = true;
    return result;
}

bool require_string(const json &arguments, const std::string &key, const std::string &tool_name,
                    std::string &out_value, json &out_error_result) {
    if (!arguments.contains(key) || !arguments[key].is_string() ||
        arguments[key].get<std::string>().empty()) {
        out_error_result = argument_error(tool_name, "non-empty string " + key);
        return false;
    }
    out_value = arguments[key].get<std::string>();
    return true;
}

bool require_number(const json &arguments, const std::string &key, const std::string &tool_name,
                    double &out_value, json &out_error_result) {
    if (!arguments.contains(key) || !arguments[key].is_number()) {
        out_error_result = argument_error(tool_name, "number " + key);
        return false;
    }
    out_value = arguments[key].get<double>();
    return true;
}

bool optional_bool(const json &arguments, const std::string &key, const std::string &tool_name,
                   bool &out_value, json &out_error_result) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_boolean()) {
        out_error_result = argument_error(tool_name, "boolean " + key + " (when given)");
        return false;
    }
    out_value = arguments[key].get<bool>();
    return true;
}

bool resolve_device(tool_handlers::ToolContext &context, const json &arguments,
                    const std::string &tool_name, devices::Device &out_device,
                    json &out_error_result) {
    std::string device_id;
    if (!require_string(arguments, "device_id", tool_name, device_id, out_error_result)) {
        return false;
    }

    devices::DeviceResult found = context.repository.find_device(device_id);
    if (!found.success) {
        out_error_result = device_error_result(tool_name, found.error);
        return false;
    }
    out_device = found.device;
    return true;
}

json device_id_schema() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"device_id", {{"type", "string"}, {"description", "Device id as returned by list_devices."}}}
    };
    input_schema["required"] = json::array({"device_id"});
    return input_schema;
}

} // namespace tool_support
