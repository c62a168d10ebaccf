#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "parameters/parameter.hpp"

namespace gistools::tools {

struct RangeSpec {
    double minimum = 0.0;
    double maximum = 0.0;
};

// Builds the parameter object for a slot. When set it takes precedence over
// ParameterDeclaration::kind.
using ParameterFactory = std::function<std::unique_ptr<parameters::Parameter>()>;

// One row of a tool's declaration table.
struct ParameterDeclaration {
    std::string slot_id;
    parameters::ParameterKind kind = parameters::ParameterKind::kString;
    int index = 0;
    std::string display_name;
    bool required = false;
    std::optional<RangeSpec> range;
    std::optional<parameters::ParameterValue> default_value;
    ParameterFactory factory;
};

// Discovered parameters in declaration order, addressable by slot id.
class ParameterSet {
public:
    using Items = std::vector<std::unique_ptr<parameters::Parameter>>;

    // Returns false (and drops the parameter) if the slot id is already taken.
    bool Add(std::unique_ptr<parameters::Parameter> parameter);

    parameters::Parameter* Find(const std::string& slot_id) const;
    const Items& All() const { return items_; }
    std::vector<parameters::Parameter*> SortedByIndex() const;

    std::size_t Size() const { return items_.size(); }

    Items::const_iterator begin() const { return items_.begin(); }
    Items::const_iterator end() const { return items_.end(); }

private:
    Items items_;
    std::unordered_map<std::string, parameters::Parameter*> by_slot_;
};

// Instantiates one parameter per declaration and binds its metadata. A slot whose
// parameter cannot be built, or whose range/default cannot be projected onto it, is
// skipped and logged under |owner|.
ParameterSet DiscoverParameters(const std::vector<ParameterDeclaration>& declarations,
                                const std::string& owner);

}  // namespace gistools::tools
