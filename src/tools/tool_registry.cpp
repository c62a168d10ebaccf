#include "tools/tool_registry.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace gistools::tools {
namespace {

ToolDefinition BuildDefinition(const GisTool& tool) {
    ToolDefinition def{};
    def.name = tool.Name();
    def.description = tool.Description();
    def.identity = tool.Identity();
    def.parameters = nlohmann::json::array();
    for (const auto* parameter : tool.Parameters().SortedByIndex()) {
        def.parameters.push_back(parameter->ToJson());
    }
    return def;
}

}  // namespace

ToolRegistry::ToolRegistry(services::AppContext* context)
    : context_(context) {}

void ToolRegistry::Register(std::unique_ptr<GisTool> tool) {
    if (!tool) {
        throw std::invalid_argument("tool");
    }
    tool->Initialize(context_);
    auto name = tool->Name();
    if (tools_.count(name) > 0) {
        utils::Logger::Current().Warn("tool", "replacing registered tool " + name);
    }
    tools_[std::move(name)] = std::move(tool);
}

GisTool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& name : List()) {
        defs.push_back(BuildDefinition(*tools_.at(name)));
    }
    return defs;
}

nlohmann::json ToolRegistry::DescribeJson(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    const auto def = BuildDefinition(*it->second);
    return {
        {"name", def.name},
        {"description", def.description},
        {"plugin", {
            {"name", def.identity.name},
            {"author", def.identity.author},
            {"version", def.identity.version}
        }},
        {"parameters", def.parameters}
    };
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    auto& logger = utils::Logger::Current();
    std::ostringstream start;
    start << "start name=" << name;
    if (!params.empty()) {
        start << " params={";
        bool first = true;
        for (const auto& [key, value] : params) {
            if (!first) {
                start << ", ";
            }
            start << key << "=" << value;
            first = false;
        }
        start << "}";
    }
    logger.Info("tool", start.str());

    tool->ResetParameterValues();
    std::string error;
    if (!tool->SetParameterValues(params, error)) {
        logger.Info("tool", "end name=" + name + " status=bad_input");
        return "Error: " + error;
    }
    if (!tool->Validate()) {
        logger.Info("tool", "end name=" + name + " status=invalid");
        return "Error: validation failed";
    }
    const bool ok = tool->Run();
    logger.Info("tool", "end name=" + name + " status=" + (ok ? "ok" : "failed"));
    return ok ? "OK" : "Error: Tool '" + name + "' failed";
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace gistools::tools
