#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_echo { void register_tool(); }
namespace tool_add { void register_tool(); }
namespace tool_get_date_time { void register_tool(); }

namespace tool_handlers {

void register_all_tools() {
    tool_echo::register_tool();
    tool_add::register_tool();
    tool_get_date_time::register_tool();
}

} // namespace tool_handlers
