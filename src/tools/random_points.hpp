#pragma once

#include <string>
#include <vector>

#include "tools/gis_tool.hpp"

namespace gistools::tools {

class RandomPointsTool : public GisTool {
public:
    // |max_points| below 1 is raised to 1.
    explicit RandomPointsTool(int max_points = 100000);

    std::string Name() const override { return "random_points"; }
    std::string Description() const override { return "Generate random points within an extent."; }
    bool Run() override;

    int PointCount() const { return GetParameter("PointCount").AsInteger(); }
    const parameters::OutputLayerInfo& Output() const { return GetParameter("Output").AsOutput(); }

protected:
    std::vector<ParameterDeclaration> DeclareParameters() const override;

private:
    int max_points_;
};

}  // namespace gistools::tools
