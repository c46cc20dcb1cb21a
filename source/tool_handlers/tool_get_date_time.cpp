#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <ctime>
#include <string>

using json = nlohmann::json;

// Long date/time form, e.g. "Saturday, October 17, 2026 3:04:05 PM".
static std::string format_long_date_time(const std::tm &local_time) {
    char weekday[32];
    char month[32];
    std::strftime(weekday, sizeof(weekday), "%A", &local_time);
    std::strftime(month, sizeof(month), "%B", &local_time);

    int hour_12 = local_time.tm_hour % 12;
    if (hour_12 == 0) {
        hour_12 = 12;
    }
    char clock[16];
    std::snprintf(clock, sizeof(clock), "%d:%02d:%02d %s", hour_12, local_time.tm_min, local_time.tm_sec,
                  local_time.tm_hour < 12 ? "AM" : "PM");

    return std::string(weekday) + ", " + month + " " + std::to_string(local_time.tm_mday) + ", " +
           std::to_string(local_time.tm_year + 1900) + " " + clock;
}

static json handle_get_date_time(const json &arguments) {
    (void)arguments; // Takes no arguments; extra ones are ignored.

    std::time_t now = std::time(nullptr);
    std::tm local_time{};
    if (localtime_r(&now, &local_time) == nullptr) {
        return mcp_tools::make_error_result("GetDateTime failed: could not read the local time.");
    }

    std::string formatted = format_long_date_time(local_time);
    debug_log::log("GetDateTime invoked: " + formatted);
    return mcp_tools::make_text_result(formatted);
}

namespace tool_get_date_time {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "GetDateTime",
        "Returns the current date and time.",
        input_schema,
        handle_get_date_time
    });
}

} // namespace tool_get_date_time
