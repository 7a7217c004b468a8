#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_arguments {

bool get_required_string(const json &arguments, const std::string &name, const std::string &tool_name,
                         std::string &output, json &error_result) {
    if (!arguments.is_object() || !arguments.contains(name) || !arguments[name].is_string()) {
        error_result = mcp_tools::build_text_result(
            tool_name + " requires a string '" + name + "'.", true);
        return false;
    }
    output = arguments[name].get<std::string>();
    return true;
}

bool get_flag(const json &arguments, const std::string &name, bool default_value) {
    if (!arguments.is_object() || !arguments.contains(name)) {
        return default_value;
    }
    const json &value = arguments[name];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text == "true") {
            return true;
        }
        if (text == "false") {
            return false;
        }
    }
    return default_value;
}

json action_result_to_json(const action_executor::ActionResult &action_result) {
    if (action_result.success && !action_result.image_base64.empty()) {
        return mcp_tools::build_image_result(action_result.message, action_result.image_base64,
                                             action_result.mime_type);
    }
    return mcp_tools::build_text_result(action_result.message, !action_result.success);
}

} // namespace tool_arguments
