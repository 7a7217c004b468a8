#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_browser_launch { void register_tool(); }
namespace tool_browser_close { void register_tool(); }
namespace tool_browser_navigate { void register_tool(); }
namespace tool_browser_screenshot { void register_tool(); }
namespace tool_browser_click { void register_tool(); }
namespace tool_browser_click_text { void register_tool(); }
namespace tool_browser_fill { void register_tool(); }
namespace tool_browser_select { void register_tool(); }
namespace tool_browser_select_text { void register_tool(); }
namespace tool_browser_hover { void register_tool(); }
namespace tool_browser_hover_text { void register_tool(); }
namespace tool_browser_evaluate { void register_tool(); }
namespace tool_browser_get_logs { void register_tool(); }

namespace tool_handlers {

void register_all_tools() {
    tool_browser_launch::register_tool();
    tool_browser_close::register_tool();
    tool_browser_navigate::register_tool();
    tool_browser_screenshot::register_tool();
    tool_browser_click::register_tool();
    tool_browser_click_text::register_tool();
    tool_browser_fill::register_tool();
    tool_browser_select::register_tool();
    tool_browser_select_text::register_tool();
    tool_browser_hover::register_tool();
    tool_browser_hover_text::register_tool();
    tool_browser_evaluate::register_tool();
    tool_browser_get_logs::register_tool();
}

} // namespace tool_handlers
