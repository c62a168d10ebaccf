#include "parameters/parameter.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"

namespace gistools::parameters {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string FormatNumber(int value) {
    return std::to_string(value);
}

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool FitsInteger(double value) {
    return std::isfinite(value)
        && value >= static_cast<double>(std::numeric_limits<int>::min())
        && value <= static_cast<double>(std::numeric_limits<int>::max());
}

bool ParseInteger(const std::string& text, int& out) {
    const auto trimmed = utils::Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t pos = 0;
        const int value = std::stoi(trimmed, &pos);
        if (pos != trimmed.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(const std::string& text, double& out) {
    const auto trimmed = utils::Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t pos = 0;
        const double value = std::stod(trimmed, &pos);
        if (pos != trimmed.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ToInteger(const ParameterValue& value, int& out) {
    return std::visit(Overloaded{
        [&](int v) { out = v; return true; },
        [&](double v) {
            if (!FitsInteger(v)) {
                return false;
            }
            out = static_cast<int>(v);
            return true;
        },
        [&](bool) { return false; },
        [&](const std::string& v) { return ParseInteger(v, out); }
    }, value);
}

bool ToDouble(const ParameterValue& value, double& out) {
    return std::visit(Overloaded{
        [&](int v) { out = static_cast<double>(v); return true; },
        [&](double v) {
            if (!std::isfinite(v)) {
                return false;
            }
            out = v;
            return true;
        },
        [&](bool) { return false; },
        [&](const std::string& v) { return ParseDouble(v, out); }
    }, value);
}

bool ToBoolean(const ParameterValue& value, bool& out) {
    return std::visit(Overloaded{
        [&](int v) { out = v != 0; return true; },
        [&](double) { return false; },
        [&](bool v) { out = v; return true; },
        [&](const std::string& v) { return utils::TryParseBool(v, out); }
    }, value);
}

std::string ToText(const ParameterValue& value) {
    return std::visit(Overloaded{
        [](int v) { return FormatNumber(v); },
        [](double v) { return FormatNumber(v); },
        [](bool v) { return std::string(v ? "true" : "false"); },
        [](const std::string& v) { return v; }
    }, value);
}

template <typename T>
bool ValidateNumeric(const NumericPayload<T>& payload, const std::string& label, bool required, std::string& error) {
    const auto current = payload.value ? payload.value : payload.default_value;
    if (!current) {
        if (required) {
            error = label + " is required.";
            return false;
        }
        return true;
    }
    const bool below = payload.min && *current < *payload.min;
    const bool above = payload.max && *current > *payload.max;
    if (!below && !above) {
        return true;
    }
    if (payload.min && payload.max) {
        error = label + " must be between " + FormatNumber(*payload.min) + " and " + FormatNumber(*payload.max) + ".";
    } else if (payload.min) {
        error = label + " must be at least " + FormatNumber(*payload.min) + ".";
    } else {
        error = label + " must be at most " + FormatNumber(*payload.max) + ".";
    }
    return false;
}

template <typename T>
void AppendNumeric(nlohmann::json& json, const NumericPayload<T>& payload) {
    if (payload.min) {
        json["minimum"] = *payload.min;
    }
    if (payload.max) {
        json["maximum"] = *payload.max;
    }
    if (payload.default_value) {
        json["default"] = *payload.default_value;
    }
}

ParameterPayload MakePayload(ParameterKind kind) {
    switch (kind) {
        case ParameterKind::kInteger: return IntegerPayload{};
        case ParameterKind::kDouble: return DoublePayload{};
        case ParameterKind::kString: return StringPayload{};
        case ParameterKind::kBoolean: return BooleanPayload{};
        case ParameterKind::kLayer: return LayerPayload{};
        case ParameterKind::kOutputLayer: return OutputLayerPayload{};
    }
    throw std::invalid_argument("unknown parameter kind " + std::to_string(static_cast<int>(kind)));
}

}  // namespace

const char* ToString(ParameterKind kind) {
    switch (kind) {
        case ParameterKind::kInteger: return "integer";
        case ParameterKind::kDouble: return "double";
        case ParameterKind::kString: return "string";
        case ParameterKind::kBoolean: return "boolean";
        case ParameterKind::kLayer: return "layer";
        case ParameterKind::kOutputLayer: return "output_layer";
    }
    return "unknown";
}

Parameter::Parameter(ParameterKind kind)
    : payload_(MakePayload(kind)) {}

template <typename T>
T& Parameter::Expect(const char* accessor) {
    if (auto* p = std::get_if<T>(&payload_)) {
        return *p;
    }
    throw std::logic_error(std::string(accessor) + " called on " + ToString(Kind()) + " parameter '" + name_ + "'");
}

template <typename T>
const T& Parameter::Expect(const char* accessor) const {
    if (const auto* p = std::get_if<T>(&payload_)) {
        return *p;
    }
    throw std::logic_error(std::string(accessor) + " called on " + ToString(Kind()) + " parameter '" + name_ + "'");
}

void Parameter::Declare(std::string name, int index, std::string display_name, bool required) {
    if (declared_) {
        throw std::logic_error("parameter '" + name_ + "' is already declared");
    }
    name_ = std::move(name);
    index_ = index;
    display_name_ = std::move(display_name);
    required_ = required;
    declared_ = true;
}

bool Parameter::IsValueParameter() const {
    switch (Kind()) {
        case ParameterKind::kInteger:
        case ParameterKind::kDouble:
        case ParameterKind::kString:
        case ParameterKind::kBoolean:
            return true;
        case ParameterKind::kLayer:
        case ParameterKind::kOutputLayer:
            return false;
    }
    return false;
}

bool Parameter::IsNumeric() const {
    return Kind() == ParameterKind::kInteger || Kind() == ParameterKind::kDouble;
}

bool Parameter::Validate(std::string& error) const {
    const auto label = display_name_.empty() ? name_ : display_name_;
    return std::visit(Overloaded{
        [&](const IntegerPayload& p) { return ValidateNumeric(p, label, required_, error); },
        [&](const DoublePayload& p) { return ValidateNumeric(p, label, required_, error); },
        [&](const StringPayload& p) {
            const auto current = p.value ? *p.value : p.default_value.value_or(std::string());
            if (required_ && utils::Trim(current).empty()) {
                error = label + " is required.";
                return false;
            }
            return true;
        },
        [&](const BooleanPayload& p) {
            if (required_ && !p.value && !p.default_value) {
                error = label + " is required.";
                return false;
            }
            return true;
        },
        [&](const LayerPayload& p) {
            if (!p.handle) {
                if (required_) {
                    error = label + " is required.";
                    return false;
                }
                return true;
            }
            if (!p.layers) {
                error = "No layers are available for " + label + ".";
                return false;
            }
            const auto* layer = p.layers->ItemByHandle(*p.handle);
            if (!layer) {
                error = "Layer not found: " + std::to_string(*p.handle);
                return false;
            }
            const auto* datasource = layer->GetDatasource();
            if (p.accepted_kind && datasource && datasource->Kind() != *p.accepted_kind) {
                error = label + " must be a " + std::string(services::ToString(*p.accepted_kind)) + " layer.";
                return false;
            }
            return true;
        },
        [&](const OutputLayerPayload& p) { return p.value.Validate(error); }
    }, payload_);
}

bool Parameter::SetRange(double minimum, double maximum) {
    if (std::isnan(minimum) || std::isnan(maximum) || minimum > maximum) {
        return false;
    }
    if (auto* p = std::get_if<IntegerPayload>(&payload_)) {
        if (!FitsInteger(minimum) || !FitsInteger(maximum)) {
            return false;
        }
        p->min = static_cast<int>(minimum);
        p->max = static_cast<int>(maximum);
        return true;
    }
    if (auto* p = std::get_if<DoublePayload>(&payload_)) {
        p->min = minimum;
        p->max = maximum;
        return true;
    }
    return false;
}

bool Parameter::SetDefaultValue(const ParameterValue& value) {
    return std::visit(Overloaded{
        [&](IntegerPayload& p) {
            int converted = 0;
            if (!ToInteger(value, converted)) {
                return false;
            }
            p.default_value = converted;
            return true;
        },
        [&](DoublePayload& p) {
            double converted = 0.0;
            if (!ToDouble(value, converted)) {
                return false;
            }
            p.default_value = converted;
            return true;
        },
        [&](StringPayload& p) {
            p.default_value = ToText(value);
            return true;
        },
        [&](BooleanPayload& p) {
            bool converted = false;
            if (!ToBoolean(value, converted)) {
                return false;
            }
            p.default_value = converted;
            return true;
        },
        [&](LayerPayload&) { return false; },
        [&](OutputLayerPayload& p) {
            const auto* name = std::get_if<std::string>(&value);
            if (!name) {
                return false;
            }
            p.default_value.name = *name;
            p.value = p.default_value;
            return true;
        }
    }, payload_);
}

bool Parameter::SetValueFromString(const std::string& text, std::string& error) {
    const auto label = display_name_.empty() ? name_ : display_name_;
    return std::visit(Overloaded{
        [&](IntegerPayload& p) {
            int value = 0;
            if (!ParseInteger(text, value)) {
                error = "Invalid integer value for " + label + ": " + text;
                return false;
            }
            p.value = value;
            return true;
        },
        [&](DoublePayload& p) {
            double value = 0.0;
            if (!ParseDouble(text, value)) {
                error = "Invalid number for " + label + ": " + text;
                return false;
            }
            p.value = value;
            return true;
        },
        [&](StringPayload& p) {
            p.value = text;
            return true;
        },
        [&](BooleanPayload& p) {
            bool value = false;
            if (!utils::TryParseBool(text, value)) {
                error = "Invalid boolean value for " + label + ": " + text;
                return false;
            }
            p.value = value;
            return true;
        },
        [&](LayerPayload& p) {
            int handle = 0;
            if (ParseInteger(text, handle)) {
                p.handle = handle;
                return true;
            }
            if (p.layers) {
                for (const auto candidate : p.layers->Handles()) {
                    const auto* layer = p.layers->ItemByHandle(candidate);
                    if (layer && layer->Name() == text) {
                        p.handle = candidate;
                        return true;
                    }
                }
            }
            error = "Layer not found: " + text;
            return false;
        },
        [&](OutputLayerPayload& p) {
            p.value.name = text;
            return true;
        }
    }, payload_);
}

bool Parameter::SetOutputOption(const std::string& option, const std::string& text, std::string& error) {
    auto* p = std::get_if<OutputLayerPayload>(&payload_);
    if (!p) {
        error = name_ + " is not an output layer parameter";
        return false;
    }
    bool flag = false;
    if (!utils::TryParseBool(text, flag)) {
        error = "Invalid boolean value for " + name_ + "." + option + ": " + text;
        return false;
    }
    if (option == "overwrite") {
        p->value.overwrite = flag;
    } else if (option == "memory") {
        p->value.memory_layer = flag;
    } else if (option == "add_to_map") {
        p->value.add_to_map = flag;
    } else {
        error = "Unknown output option: " + option;
        return false;
    }
    return true;
}

bool Parameter::HasValue() const {
    return std::visit(Overloaded{
        [](const IntegerPayload& p) { return p.value.has_value(); },
        [](const DoublePayload& p) { return p.value.has_value(); },
        [](const StringPayload& p) { return p.value.has_value(); },
        [](const BooleanPayload& p) { return p.value.has_value(); },
        [](const LayerPayload& p) { return p.handle.has_value(); },
        [](const OutputLayerPayload& p) { return !p.value.name.empty(); }
    }, payload_);
}

void Parameter::ClearValue() {
    std::visit(Overloaded{
        [](IntegerPayload& p) { p.value.reset(); },
        [](DoublePayload& p) { p.value.reset(); },
        [](StringPayload& p) { p.value.reset(); },
        [](BooleanPayload& p) { p.value.reset(); },
        [](LayerPayload& p) { p.handle.reset(); },
        [](OutputLayerPayload& p) { p.value = p.default_value; }
    }, payload_);
}

int Parameter::AsInteger() const {
    const auto& p = Expect<IntegerPayload>("AsInteger");
    return p.value.value_or(p.default_value.value_or(0));
}

double Parameter::AsDouble() const {
    const auto& p = Expect<DoublePayload>("AsDouble");
    return p.value.value_or(p.default_value.value_or(0.0));
}

bool Parameter::AsBoolean() const {
    const auto& p = Expect<BooleanPayload>("AsBoolean");
    return p.value.value_or(p.default_value.value_or(false));
}

std::string Parameter::AsString() const {
    const auto& p = Expect<StringPayload>("AsString");
    return p.value.value_or(p.default_value.value_or(std::string()));
}

const OutputLayerInfo& Parameter::AsOutput() const {
    return Expect<OutputLayerPayload>("AsOutput").value;
}

OutputLayerInfo& Parameter::MutableOutput() {
    return Expect<OutputLayerPayload>("MutableOutput").value;
}

void Parameter::SetLayerFilter(services::DatasourceKind kind) {
    Expect<LayerPayload>("SetLayerFilter").accepted_kind = kind;
}

void Parameter::BindLayers(services::LayerCollection* layers) {
    Expect<LayerPayload>("BindLayers").layers = layers;
}

void Parameter::SelectLayer(int handle) {
    Expect<LayerPayload>("SelectLayer").handle = handle;
}

services::Layer* Parameter::SelectedLayer() const {
    const auto& p = Expect<LayerPayload>("SelectedLayer");
    if (!p.handle || !p.layers) {
        return nullptr;
    }
    return p.layers->ItemByHandle(*p.handle);
}

nlohmann::json Parameter::ToJson() const {
    nlohmann::json json = {
        {"name", name_},
        {"index", index_},
        {"displayName", display_name_},
        {"kind", ToString(Kind())},
        {"required", required_}
    };
    std::visit(Overloaded{
        [&](const IntegerPayload& p) { AppendNumeric(json, p); },
        [&](const DoublePayload& p) { AppendNumeric(json, p); },
        [&](const StringPayload& p) {
            if (p.default_value) {
                json["default"] = *p.default_value;
            }
        },
        [&](const BooleanPayload& p) {
            if (p.default_value) {
                json["default"] = *p.default_value;
            }
        },
        [&](const LayerPayload& p) {
            if (p.accepted_kind) {
                json["layerType"] = services::ToString(*p.accepted_kind);
            }
        },
        [&](const OutputLayerPayload& p) {
            json["output"] = {
                {"name", p.value.name},
                {"memoryLayer", p.value.memory_layer},
                {"overwrite", p.value.overwrite},
                {"addToMap", p.value.add_to_map}
            };
        }
    }, payload_);
    return json;
}

}  // namespace gistools::parameters
