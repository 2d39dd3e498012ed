#include "agent/tools/tool_registry.hpp"

#include <algorithm>

namespace librarian::agent::tools {

ToolRegistry::ToolRegistry(std::shared_ptr<utils::LogSink> sink)
    : sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {}

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_.insert_or_assign(std::move(name), std::move(tool));
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<providers::ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<providers::ToolDefinition> defs;
    for (const auto& name : List()) {
        const auto& tool = tools_.at(name);
        defs.push_back({name, tool->Description(), tool->ParametersJson()});
    }
    return defs;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    utils::LogFields fields{{"name", name}};
    for (const auto& [key, value] : params) {
        fields.emplace(key, value);
    }
    sink_->Log(utils::LogLevel::kInfo, "tool", "start", fields);

    std::string result;
    try {
        result = tool->Execute(params);
    } catch (const std::exception& ex) {
        result = "Error: Tool '" + name + "' failed: " + ex.what();
    }
    sink_->Log(utils::LogLevel::kInfo, "tool", "end", {
        {"name", name},
        {"size", std::to_string(result.size())}
    });
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace librarian::agent::tools
