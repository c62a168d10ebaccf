#include "tools/gis_tool.hpp"

#include <stdexcept>

#include "tools/output_dispatcher.hpp"

namespace gistools::tools {

void GisTool::Initialize(services::AppContext* context) {
    if (!context) {
        throw std::invalid_argument("context");
    }
    if (!context->layers || !context->messages || !context->layer_service) {
        throw std::invalid_argument("context of tool '" + Name() + "' is missing a service");
    }
    context_ = context;

    for (const auto& parameter : Parameters()) {
        if (parameter->IsLayer()) {
            parameter->BindLayers(context->layers);
        }
    }

    messages_ = context->messages;
    layer_service_ = context->layer_service;
}

bool GisTool::Validate() {
    auto& messages = Messages();
    for (const auto& parameter : Parameters()) {
        if (!parameter->IsOutputLayer() && !parameter->IsValueParameter()) {
            continue;
        }
        std::string error;
        if (!parameter->Validate(error)) {
            messages.Info(error);
            return false;
        }
    }
    return true;
}

const ParameterSet& GisTool::Parameters() const {
    if (!parameters_) {
        parameters_ = std::make_unique<ParameterSet>(DiscoverParameters(DeclareParameters(), Name()));
    }
    return *parameters_;
}

parameters::Parameter* GisTool::FindParameter(const std::string& slot_id) const {
    return Parameters().Find(slot_id);
}

parameters::Parameter& GisTool::GetParameter(const std::string& slot_id) const {
    auto* parameter = FindParameter(slot_id);
    if (!parameter) {
        throw std::out_of_range("tool '" + Name() + "' has no parameter '" + slot_id + "'");
    }
    return *parameter;
}

bool GisTool::SetParameterValues(const std::unordered_map<std::string, std::string>& values, std::string& error) {
    for (const auto& [key, value] : values) {
        const auto dot = key.find('.');
        const auto slot_id = key.substr(0, dot);
        auto* parameter = FindParameter(slot_id);
        if (!parameter) {
            error = "Unknown parameter: " + slot_id;
            return false;
        }
        const bool applied = dot == std::string::npos
            ? parameter->SetValueFromString(value, error)
            : parameter->SetOutputOption(key.substr(dot + 1), value, error);
        if (!applied) {
            return false;
        }
    }
    return true;
}

void GisTool::ResetParameterValues() {
    for (const auto& parameter : Parameters()) {
        parameter->ClearValue();
    }
}

bool GisTool::HandleOutput(std::unique_ptr<services::Datasource> datasource,
                           const parameters::OutputLayerInfo& info) {
    OutputDispatcher dispatcher(Layers(), *Context().layers, messages_);
    return dispatcher.HandleOutput(std::move(datasource), info);
}

services::MessageService& GisTool::Messages() const {
    if (!messages_) {
        throw std::logic_error("tool '" + Name() + "' is not initialized");
    }
    return *messages_;
}

services::LayerService& GisTool::Layers() const {
    if (!layer_service_) {
        throw std::logic_error("tool '" + Name() + "' is not initialized");
    }
    return *layer_service_;
}

services::AppContext& GisTool::Context() const {
    if (!context_) {
        throw std::logic_error("tool '" + Name() + "' is not initialized");
    }
    return *context_;
}

}  // namespace gistools::tools
