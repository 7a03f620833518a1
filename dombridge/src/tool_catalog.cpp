#include "tool_catalog.hpp"

#include <initializer_list>
#include <utility>

namespace dombridge {

namespace {

using Property = std::pair<const char*, const char*>;

nlohmann::json object_schema(std::initializer_list<Property> properties) {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"required", nlohmann::json::array()},
    };
    for (const auto& property : properties) {
        schema["properties"][property.first] = {{"type", "string"}, {"description", property.second}};
        schema["required"].push_back(property.first);
    }
    return schema;
}

ToolDefinition remote_tool(const char* name, const char* action, const char* description,
                           std::initializer_list<Property> properties) {
    ToolDefinition tool;
    tool.name = name;
    tool.action = action;
    tool.description = description;
    tool.input_schema = object_schema(properties);
    return tool;
}

std::vector<ToolDefinition> builtin_tools() {
    std::vector<ToolDefinition> tools;
    tools.push_back(remote_tool("find_element", "find_element", "Find an element using CSS selector",
                                {{"selector", "CSS selector"}}));
    tools.push_back(remote_tool("click_element", "click_element", "Click an element on the page",
                                {{"selector", "CSS selector"}}));
    tools.push_back(remote_tool("input_text", "input_text", "Input text into an element",
                                {{"selector", "CSS selector"}, {"text", "Text to input"}}));
    tools.push_back(remote_tool("get_element_text", "get_text", "Get text content from an element",
                                {{"selector", "CSS selector"}}));
    tools.push_back(remote_tool("send_key", "send_key", "Send key press to an element",
                                {{"selector", "CSS selector"}, {"key", "Key to send"}}));
    tools.push_back(remote_tool("get_page_info", "get_page_info", "Get current page information", {}));
    tools.push_back(remote_tool("get_last_clicked_element", "get_last_clicked_element",
                                "Get last clicked element info", {}));

    ToolDefinition saved = remote_tool("list_saved_selectors", "", "List all saved CSS selectors", {});
    saved.local = true;
    tools.push_back(std::move(saved));
    return tools;
}

} // namespace

std::vector<std::string> ToolDefinition::required_arguments() const {
    std::vector<std::string> required;
    auto it = input_schema.find("required");
    if (it == input_schema.end() || !it->is_array()) {
        return required;
    }
    for (const auto& name : *it) {
        if (name.is_string()) {
            required.push_back(name.get<std::string>());
        }
    }
    return required;
}

nlohmann::json ToolDefinition::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema},
    };
}

const ToolCatalog& ToolCatalog::builtin() {
    static const ToolCatalog catalog(builtin_tools());
    return catalog;
}

ToolCatalog::ToolCatalog(std::vector<ToolDefinition> tools)
    : tools_(std::move(tools)) {}

const ToolDefinition* ToolCatalog::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

nlohmann::json ToolCatalog::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        list.push_back(tool.to_json());
    }
    return list;
}

} // namespace dombridge
