#include "registry/tool_registry_abi.hpp"
#include "protocol/json_rpc.hpp"

namespace tool_registry {

const char *to_string(CallErrorKind kind) {
    switch (kind) {
    case CallErrorKind::none:
        return "none";
    case CallErrorKind::tool_not_found:
        return "tool not found";
    case CallErrorKind::argument_error:
        return "argument error";
    case CallErrorKind::transport_error:
        return "transport error";
    }
    return "unknown";
}

ContentItem parse_content_item(const json &entry) {
    ContentItem item;
    if (!entry.is_object()) {
        item.kind = "unknown";
        item.data = entry;
        return item;
    }

    item.kind = json_rpc::get_string(entry, "type", "unknown");
    if (item.kind == "text" && entry.contains("text") && entry["text"].is_string()) {
        item.text = entry["text"].get<std::string>();
        return item;
    }

    // Opaque payloads: base64 data for image/audio, embedded resource objects otherwise.
    if (entry.contains("data")) {
        item.data = entry["data"];
    } else if (entry.contains("resource")) {
        item.data = entry["resource"];
    } else {
        json rest = entry;
        rest.erase("type");
        if (!rest.empty()) {
            item.data = rest;
        }
    }
    return item;
}

std::optional<ToolDescriptor> parse_tool_descriptor(const json &entry) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        return std::nullopt;
    }

    ToolDescriptor descriptor;
    descriptor.name = entry["name"].get<std::string>();
    if (descriptor.name.empty()) {
        return std::nullopt;
    }
    if (entry.contains("description") && entry["description"].is_string()) {
        descriptor.description = entry["description"].get<std::string>();
    }
    if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
        descriptor.schema = entry["inputSchema"];
    }
    return descriptor;
}

} // namespace tool_registry
