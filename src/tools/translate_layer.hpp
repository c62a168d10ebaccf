#pragma once

#include <string>
#include <vector>

#include "tools/gis_tool.hpp"

namespace gistools::tools {

// Copies a point layer shifted by a constant offset.
class TranslateLayerTool : public GisTool {
public:
    std::string Name() const override { return "translate_layer"; }
    std::string Description() const override { return "Shift all points of a layer by an offset."; }
    bool Run() override;

protected:
    std::vector<ParameterDeclaration> DeclareParameters() const override;
};

}  // namespace gistools::tools
