#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_echo(const json &arguments) {
    if (!arguments.contains("message") || !arguments["message"].is_string()) {
        return mcp_tools::make_error_result("Echo requires a string 'message'.");
    }

    std::string message = arguments["message"].get<std::string>();
    debug_log::log("Echo invoked, message length=" + std::to_string(message.size()));
    return mcp_tools::make_text_result("hello " + message);
}

namespace tool_echo {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"message", {{"type", "string"}, {"description", "Message to echo back."}}}
    };
    input_schema["required"] = json::array({"message"});

    mcp_tools::register_tool({
        "Echo",
        "Echoes the message back to the client.",
        input_schema,
        handle_echo
    });
}

} // namespace tool_echo
