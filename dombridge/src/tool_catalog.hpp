#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace dombridge {

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::string action;  // extension action the tool maps to
    bool local = false;  // answered without a channel round trip

    std::vector<std::string> required_arguments() const;
    nlohmann::json to_json() const;
};

/// Fixed tool surface offered to the AI client.
class ToolCatalog {
public:
    static const ToolCatalog& builtin();

    explicit ToolCatalog(std::vector<ToolDefinition> tools);

    const ToolDefinition* find(const std::string& name) const;
    const std::vector<ToolDefinition>& tools() const { return tools_; }
    std::size_t size() const { return tools_.size(); }

    /// [{name, description, inputSchema}, ...]
    nlohmann::json to_json() const;

private:
    std::vector<ToolDefinition> tools_;
};

} // namespace dombridge
