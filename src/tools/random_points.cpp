#include "tools/random_points.hpp"

#include <algorithm>
#include <memory>
#include <random>

#include "data/point_datasource.hpp"
#include "utils/logging.hpp"

namespace gistools::tools {

using parameters::ParameterKind;

RandomPointsTool::RandomPointsTool(int max_points)
    : max_points_(std::max(1, max_points)) {}

std::vector<ParameterDeclaration> RandomPointsTool::DeclareParameters() const {
    return {
        {"PointCount", ParameterKind::kInteger, 0, "Number of points", true,
         RangeSpec{1, static_cast<double>(max_points_)}, std::min(100, max_points_), {}},
        {"MinX", ParameterKind::kDouble, 1, "Minimum X", true, std::nullopt, 0.0, {}},
        {"MinY", ParameterKind::kDouble, 2, "Minimum Y", true, std::nullopt, 0.0, {}},
        {"MaxX", ParameterKind::kDouble, 3, "Maximum X", true, std::nullopt, 100.0, {}},
        {"MaxY", ParameterKind::kDouble, 4, "Maximum Y", true, std::nullopt, 100.0, {}},
        {"Seed", ParameterKind::kInteger, 5, "Random seed", false, std::nullopt, std::nullopt, {}},
        {"Output", ParameterKind::kOutputLayer, 6, "Output layer", true,
         std::nullopt, std::string("random_points.geojson"), {}},
    };
}

bool RandomPointsTool::Run() {
    const data::Extent extent{
        GetParameter("MinX").AsDouble(),
        GetParameter("MinY").AsDouble(),
        GetParameter("MaxX").AsDouble(),
        GetParameter("MaxY").AsDouble()};
    if (!extent.IsValid()) {
        Messages().Info("Extent is empty: minimum must not exceed maximum.");
        return false;
    }

    const auto& seed = GetParameter("Seed");
    std::mt19937 gen(seed.HasValue() ? static_cast<std::mt19937::result_type>(seed.AsInteger())
                                     : std::random_device{}());
    std::uniform_real_distribution<double> dist_x(extent.min_x, extent.max_x);
    std::uniform_real_distribution<double> dist_y(extent.min_y, extent.max_y);

    auto source = std::make_unique<data::PointDatasource>();
    const int count = PointCount();
    for (int i = 0; i < count; ++i) {
        source->AddPoint(data::Point{dist_x(gen), dist_y(gen)});
    }
    utils::Logger::Current().Debug("random_points", "generated " + std::to_string(count) + " points");

    return HandleOutput(std::move(source), Output());
}

}  // namespace gistools::tools
