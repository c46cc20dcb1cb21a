#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

static std::vector<ToolDefinition>::iterator find_tool(const std::string &tool_name) {
    return std::find_if(registered_tools.begin(), registered_tools.end(),
                        [&tool_name](const ToolDefinition &tool) { return tool.name == tool_name; });
}

void register_tool(const ToolDefinition &definition) {
    auto existing = find_tool(definition.name);
    if (existing != registered_tools.end()) {
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

void clear_registered_tools() {
    registered_tools.clear();
}

bool has_tool(const std::string &tool_name) {
    return find_tool(tool_name) != registered_tools.end();
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    auto tool = find_tool(tool_name);
    if (tool == registered_tools.end()) {
        return make_error_result("Unknown tool: " + tool_name);
    }

    try {
        return tool->handler(arguments);
    } catch (const json::exception &error) {
        // Handlers validate their arguments; this only catches type surprises in nested values.
        debug_log::log("Tool " + tool_name + " threw: " + std::string(error.what()));
        return make_error_result(tool_name + " failed: " + std::string(error.what()));
    }
}

json make_text_result(const std::string &text) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = false;
    return result;
}

json make_error_result(const std::string &text) {
    json result = make_text_result(text);
    result["isError"] = true;
    return result;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
