#ifndef WEBMCPS_TOOL_ARGUMENTS_HPP
#define WEBMCPS_TOOL_ARGUMENTS_HPP

// Argument helpers shared by the browser_* tool handlers.

#include <nlohmann/json.hpp>
#include <string>

#include "actions/action_executor.hpp"

namespace tool_arguments {

using json = nlohmann::json;

// Read the required string argument `name`. When it is missing or not a
// string, error_result receives a failure envelope naming the argument.
bool get_required_string(const json &arguments, const std::string &name, const std::string &tool_name,
                         std::string &output, json &error_result);

// Optional boolean that also accepts the strings "true" / "false".
bool get_flag(const json &arguments, const std::string &name, bool default_value);

// Text (and image, for screenshots) envelope of an executor result.
json action_result_to_json(const action_executor::ActionResult &action_result);

} // namespace tool_arguments

#endif // WEBMCPS_TOOL_ARGUMENTS_HPP
