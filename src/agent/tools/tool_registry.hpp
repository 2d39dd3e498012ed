#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"
#include "providers/llm_provider.hpp"
#include "utils/logging.hpp"

namespace librarian::agent::tools {

class ToolRegistry {
public:
    explicit ToolRegistry(std::shared_ptr<utils::LogSink> sink = nullptr);

    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<providers::ToolDefinition> GetDefinitions() const;
    std::string Execute(const std::string& name,
                        const std::unordered_map<std::string, std::string>& params);

    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
    std::shared_ptr<utils::LogSink> sink_;
};

}  // namespace librarian::agent::tools
