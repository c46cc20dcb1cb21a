#include "llm/tool_dispatcher.hpp"
#include "utils/debug_log.hpp"

#include <cmath>
#include <exception>
#include <ostream>
#include <sstream>

namespace tool_dispatcher {

using json = nlohmann::json;

static std::string describe_value(const nlohmann::ordered_json &value) {
    if (value.is_number_float()) {
        double number = value.get<double>();
        if (std::floor(number) == number && std::fabs(number) < 1e15) {
            return std::to_string(static_cast<long long>(number));
        }
    }
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string render_content(const std::vector<tool_registry::ContentItem> &content) {
    if (content.empty()) {
        return "No content returned";
    }

    std::ostringstream rendered;
    bool first = true;
    for (const auto &item : content) {
        if (!first) {
            rendered << "\n";
        }
        first = false;

        if (item.kind == "text") {
            rendered << item.text.value_or("");
            continue;
        }

        rendered << "[Content of type " << item.kind << "]";
        if (item.data) {
            rendered << "\nData: " << item.data->dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }
    return rendered.str();
}

std::string describe_arguments(const nlohmann::ordered_json &arguments) {
    std::string description;
    if (!arguments.is_object()) {
        return description;
    }
    for (const auto &item : arguments.items()) {
        if (!description.empty()) {
            description += ", ";
        }
        description += item.key() + "=" + describe_value(item.value());
    }
    return description;
}

static void write_indented(std::ostream &output, const std::string &text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        output << "  " << line << "\n";
    }
}

DispatchOutcome dispatch(tool_registry::ToolRegistry &registry,
                         const tool_call_parser::ExtractedCall &call,
                         std::ostream &output) {
    DispatchOutcome outcome;
    outcome.tool_name = call.tool_name;

    std::string argument_text = describe_arguments(call.arguments);
    if (argument_text.empty()) {
        output << "Calling " << call.tool_name << " tool" << std::endl;
    } else {
        output << "Calling " << call.tool_name << " tool with " << argument_text << std::endl;
    }

    tool_registry::CallToolResult result;
    try {
        result = registry.call_tool(call.tool_name, call.arguments);
    } catch (const std::exception &error) {
        result = tool_registry::CallToolResult();
        result.error_kind = tool_registry::CallErrorKind::transport_error;
        result.error_detail = error.what();
    }

    if (!result.success) {
        outcome.error_detail = result.error_detail;
        debug_log::log("Call to " + call.tool_name + " failed (" + tool_registry::to_string(result.error_kind) +
                       "): " + result.error_detail);
        output << "Error calling " << call.tool_name << " tool: " << result.error_detail << std::endl;
        return outcome;
    }

    outcome.rendered_text = render_content(result.content);
    if (result.is_error) {
        output << "Tool " << call.tool_name << " reported an error:" << "\n";
    } else {
        output << "Tool Result:" << "\n";
        outcome.success = true;
    }
    write_indented(output, outcome.rendered_text);
    output.flush();
    return outcome;
}

std::string summarize(const DispatchOutcome &outcome) {
    if (outcome.success) {
        return "Tool " + outcome.tool_name + " returned: " + outcome.rendered_text;
    }
    if (!outcome.error_detail.empty()) {
        return "Tool " + outcome.tool_name + " failed: " + outcome.error_detail;
    }
    return "Tool " + outcome.tool_name + " failed: " + outcome.rendered_text;
}

} // namespace tool_dispatcher
