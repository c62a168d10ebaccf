#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "parameters/parameter.hpp"
#include "services/services.hpp"
#include "tools/parameter_discovery.hpp"

namespace gistools::tools {

struct PluginIdentity {
    std::string name;
    std::string author;
    std::string version;
};

// Base class for GIS tools.
//
// Lifecycle: construct, Initialize(context) once, fill parameter values, Validate(), Run().
// Parameters come from DeclareParameters() and are discovered on first access, then kept
// for the lifetime of the tool.
class GisTool {
public:
    virtual ~GisTool() = default;

    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;

    const PluginIdentity& Identity() const { return identity_; }
    void SetIdentity(PluginIdentity identity) { identity_ = std::move(identity); }

    // Binds the tool to the host services. Throws std::invalid_argument if the context or
    // one of its services is missing. Meant to be called once per tool.
    virtual void Initialize(services::AppContext* context);
    bool IsInitialized() const { return context_ != nullptr; }

    // Checks value and output-layer parameters in order. The first failure is shown
    // through the message service and stops the check.
    bool Validate();

    virtual bool Run() = 0;

    const ParameterSet& Parameters() const;
    parameters::Parameter* FindParameter(const std::string& slot_id) const;
    // Throws std::out_of_range for an undeclared slot.
    parameters::Parameter& GetParameter(const std::string& slot_id) const;

    // Keys are slot ids; "<slot>.<option>" sets an output layer flag.
    bool SetParameterValues(const std::unordered_map<std::string, std::string>& values, std::string& error);
    void ResetParameterValues();

protected:
    virtual std::vector<ParameterDeclaration> DeclareParameters() const = 0;

    bool HandleOutput(std::unique_ptr<services::Datasource> datasource,
                      const parameters::OutputLayerInfo& info);

    services::MessageService& Messages() const;
    services::LayerService& Layers() const;
    services::AppContext& Context() const;

private:
    PluginIdentity identity_;
    services::AppContext* context_ = nullptr;
    services::MessageService* messages_ = nullptr;
    services::LayerService* layer_service_ = nullptr;
    mutable std::unique_ptr<ParameterSet> parameters_;
};

}  // namespace gistools::tools
