#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"
#include "services/services.hpp"
#include "tools/gis_tool.hpp"

namespace gistools::tools {

struct ToolDefinition {
    std::string name;
    std::string description;
    PluginIdentity identity;
    nlohmann::json parameters;
};

class ToolRegistry {
public:
    // Tools are initialized with |context| when registered.
    explicit ToolRegistry(services::AppContext* context);

    void Register(std::unique_ptr<GisTool> tool);
    GisTool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<ToolDefinition> GetDefinitions() const;
    nlohmann::json DescribeJson(const std::string& name) const;

    // Resets the tool's values, applies |params|, validates and runs it. Returns "OK" or
    // an "Error: ..." text.
    std::string Execute(const std::string& name,
                        const std::unordered_map<std::string, std::string>& params);

    std::vector<std::string> List() const;

private:
    services::AppContext* context_;
    std::unordered_map<std::string, std::unique_ptr<GisTool>> tools_;
};

}  // namespace gistools::tools
