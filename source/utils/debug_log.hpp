#ifndef MCPLINK_DEBUG_LOG_HPP
#define MCPLINK_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if MCPLINK_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [mcplink] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [mcplink] prefix unconditionally.
void info(const std::string &message);

} // namespace debug_log

#endif // MCPLINK_DEBUG_LOG_HPP
