#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_list_devices { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_boot_device { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_shutdown_device { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_restart_device { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_delete_device { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_device_status { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_set_battery { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_set_location { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_install_app { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_create_simulator { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }
namespace tool_list_simulator_options { void register_tool(mcp_tools::ToolRegistry &, tool_handlers::ToolContext &); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, ToolContext &context) {
    tool_list_devices::register_tool(registry, context);
    tool_boot_device::register_tool(registry, context);
    tool_shutdown_device::register_tool(registry, context);
    tool_restart_device::register_tool(registry, context);
    tool_delete_device::register_tool(registry, context);
    tool_device_status::register_tool(registry, context);
    tool_set_battery::register_tool(registry, context);
    tool_set_location::register_tool(registry, context);
    tool_install_app::register_tool(registry, context);
    tool_create_simulator::register_tool(registry, context);
    tool_list_simulator_options::register_tool(registry, context);
}

} // namespace tool_handlers
