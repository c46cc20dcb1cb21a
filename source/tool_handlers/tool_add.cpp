#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

using json = nlohmann::json;

// Shortest decimal text that reads back as the same double: 59, 2.5, 0.30000000000000004.
static std::string format_number(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }

    std::string text;
    for (int precision = 15; precision <= 17; precision++) {
        std::ostringstream stream;
        stream << std::setprecision(precision) << value;
        text = stream.str();
        if (!std::isfinite(value) || std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }
    return text;
}

static json handle_add(const json &arguments) {
    if (!arguments.contains("a") || !arguments["a"].is_number() ||
        !arguments.contains("b") || !arguments["b"].is_number()) {
        return mcp_tools::make_error_result("Add requires numbers 'a' and 'b' (e.g. a=2, b=3).");
    }

    double first = arguments["a"].get<double>();
    double second = arguments["b"].get<double>();
    std::string sum = format_number(first + second);

    debug_log::log("Add invoked a=" + format_number(first) + " b=" + format_number(second) + " sum=" + sum);
    return mcp_tools::make_text_result(sum);
}

namespace tool_add {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"a", {{"type", "number"}, {"description", "First number to add"}}},
        {"b", {{"type", "number"}, {"description", "Second number to add"}}}
    };
    input_schema["required"] = json::array({"a", "b"});

    mcp_tools::register_tool({
        "Add",
        "Adds two numbers together and returns the result.",
        input_schema,
        handle_add
    });
}

} // namespace tool_add
