#ifndef WEBMCPS_DEBUG_LOG_HPP
#define WEBMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if WEBMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [webmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [webmcps] prefix unconditionally.
// Used for launch/connect problems and teardown failures the operator should see.
void warn(const std::string &message);

} // namespace debug_log

#endif // WEBMCPS_DEBUG_LOG_HPP
