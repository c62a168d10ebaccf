#pragma once

#include <optional>
#include <string>
#include <variant>

#include "nlohmann/json.hpp"
#include "parameters/output_layer_info.hpp"
#include "services/layer.hpp"

namespace gistools::parameters {

// Order matches the alternatives of ParameterPayload.
enum class ParameterKind {
    kInteger,
    kDouble,
    kString,
    kBoolean,
    kLayer,
    kOutputLayer
};

const char* ToString(ParameterKind kind);

// Scalar used for declared defaults, independent of the parameter kind.
using ParameterValue = std::variant<int, double, bool, std::string>;

template <typename T>
struct NumericPayload {
    std::optional<T> value;
    std::optional<T> default_value;
    std::optional<T> min;
    std::optional<T> max;
};

using IntegerPayload = NumericPayload<int>;
using DoublePayload = NumericPayload<double>;

struct StringPayload {
    std::optional<std::string> value;
    std::optional<std::string> default_value;
};

struct BooleanPayload {
    std::optional<bool> value;
    std::optional<bool> default_value;
};

struct LayerPayload {
    std::optional<int> handle;
    services::LayerCollection* layers = nullptr;
    std::optional<services::DatasourceKind> accepted_kind;
};

struct OutputLayerPayload {
    OutputLayerInfo value;
    OutputLayerInfo default_value;
};

using ParameterPayload = std::variant<
    IntegerPayload,
    DoublePayload,
    StringPayload,
    BooleanPayload,
    LayerPayload,
    OutputLayerPayload>;

// One named slot of a tool. Identity (name, index, label, required) is assigned once by
// Declare() during discovery; the payload holds the kind-specific state.
class Parameter {
public:
    explicit Parameter(ParameterKind kind);

    ParameterKind Kind() const { return static_cast<ParameterKind>(payload_.index()); }
    const std::string& Name() const { return name_; }
    int Index() const { return index_; }
    const std::string& DisplayName() const { return display_name_; }
    bool Required() const { return required_; }

    // Throws std::logic_error when called a second time.
    void Declare(std::string name, int index, std::string display_name, bool required);

    bool IsValueParameter() const;
    bool IsNumeric() const;
    bool IsLayer() const { return Kind() == ParameterKind::kLayer; }
    bool IsOutputLayer() const { return Kind() == ParameterKind::kOutputLayer; }

    bool Validate(std::string& error) const;

    // Binds numeric bounds. Integer parameters truncate. Returns false for non-numeric
    // kinds and for minimum > maximum.
    bool SetRange(double minimum, double maximum);

    // Converts |value| to this parameter's kind. Returns false if it cannot be represented.
    bool SetDefaultValue(const ParameterValue& value);

    // Host input. On failure |error| holds a message suitable for the user.
    bool SetValueFromString(const std::string& text, std::string& error);

    // Output layer flags: "overwrite", "memory", "add_to_map".
    bool SetOutputOption(const std::string& option, const std::string& text, std::string& error);

    bool HasValue() const;
    // Drops the explicit value; defaults, bounds and layer bindings stay.
    void ClearValue();

    // Typed reads; they fall back to the default, then to a zero value. Reading the wrong
    // kind throws std::logic_error.
    int AsInteger() const;
    double AsDouble() const;
    bool AsBoolean() const;
    std::string AsString() const;
    const OutputLayerInfo& AsOutput() const;
    OutputLayerInfo& MutableOutput();

    void SetLayerFilter(services::DatasourceKind kind);
    void BindLayers(services::LayerCollection* layers);
    void SelectLayer(int handle);
    // nullptr when nothing is selected or the handle is not in the bound collection.
    services::Layer* SelectedLayer() const;

    template <typename T>
    const T* PayloadIf() const { return std::get_if<T>(&payload_); }

    template <typename T>
    T* PayloadIf() { return std::get_if<T>(&payload_); }

    nlohmann::json ToJson() const;

private:
    template <typename T>
    T& Expect(const char* accessor);
    template <typename T>
    const T& Expect(const char* accessor) const;

    std::string name_;
    int index_ = 0;
    std::string display_name_;
    bool required_ = false;
    bool declared_ = false;
    ParameterPayload payload_;
};

}  // namespace gistools::parameters
