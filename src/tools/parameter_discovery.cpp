#include "tools/parameter_discovery.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/logging.hpp"

namespace gistools::tools {
namespace {

std::unique_ptr<parameters::Parameter> BuildParameter(const ParameterDeclaration& declaration,
                                                      std::string& reason) {
    auto parameter = declaration.factory
        ? declaration.factory()
        : std::make_unique<parameters::Parameter>(declaration.kind);
    if (!parameter) {
        reason = "factory produced no parameter";
        return nullptr;
    }

    parameter->Declare(declaration.slot_id, declaration.index, declaration.display_name, declaration.required);

    // Ranges on non-numeric parameters are ignored.
    if (declaration.range && parameter->IsNumeric()) {
        if (!parameter->SetRange(declaration.range->minimum, declaration.range->maximum)) {
            reason = "range cannot be applied to " + std::string(parameters::ToString(parameter->Kind())) + " parameter";
            return nullptr;
        }
    }

    if (declaration.default_value && !parameter->SetDefaultValue(*declaration.default_value)) {
        reason = "default value does not fit " + std::string(parameters::ToString(parameter->Kind())) + " parameter";
        return nullptr;
    }
    return parameter;
}

}  // namespace

bool ParameterSet::Add(std::unique_ptr<parameters::Parameter> parameter) {
    if (!parameter || by_slot_.count(parameter->Name()) > 0) {
        return false;
    }
    by_slot_.emplace(parameter->Name(), parameter.get());
    items_.push_back(std::move(parameter));
    return true;
}

parameters::Parameter* ParameterSet::Find(const std::string& slot_id) const {
    auto it = by_slot_.find(slot_id);
    if (it == by_slot_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<parameters::Parameter*> ParameterSet::SortedByIndex() const {
    std::vector<parameters::Parameter*> sorted;
    sorted.reserve(items_.size());
    for (const auto& item : items_) {
        sorted.push_back(item.get());
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const parameters::Parameter* a, const parameters::Parameter* b) {
        return a->Index() < b->Index();
    });
    return sorted;
}

ParameterSet DiscoverParameters(const std::vector<ParameterDeclaration>& declarations,
                                const std::string& owner) {
    auto& logger = utils::Logger::Current();
    ParameterSet result;
    for (const auto& declaration : declarations) {
        std::string reason;
        std::unique_ptr<parameters::Parameter> parameter;
        try {
            parameter = BuildParameter(declaration, reason);
        } catch (const std::exception& ex) {
            reason = ex.what();
        }
        if (!parameter) {
            logger.Warn("discovery", owner + ": skipped slot '" + declaration.slot_id + "': " + reason);
            continue;
        }
        if (!result.Add(std::move(parameter))) {
            logger.Warn("discovery", owner + ": skipped duplicate slot '" + declaration.slot_id + "'");
        }
    }
    logger.Debug("discovery", owner + ": " + std::to_string(result.Size()) + " parameters");
    return result;
}

}  // namespace gistools::tools
