#include "tools/translate_layer.hpp"

#include <memory>

#include "data/point_datasource.hpp"

namespace gistools::tools {

using parameters::ParameterKind;

std::vector<ParameterDeclaration> TranslateLayerTool::DeclareParameters() const {
    ParameterFactory vector_layer = [] {
        auto parameter = std::make_unique<parameters::Parameter>(ParameterKind::kLayer);
        parameter->SetLayerFilter(services::DatasourceKind::kVector);
        return parameter;
    };
    return {
        {"Input", ParameterKind::kLayer, 0, "Input layer", true, std::nullopt, std::nullopt, vector_layer},
        {"OffsetX", ParameterKind::kDouble, 1, "Offset X", true, std::nullopt, 0.0, {}},
        {"OffsetY", ParameterKind::kDouble, 2, "Offset Y", true, std::nullopt, 0.0, {}},
        {"Output", ParameterKind::kOutputLayer, 3, "Output layer", true,
         std::nullopt, std::string("translated.geojson"), {}},
    };
}

bool TranslateLayerTool::Run() {
    // Layer parameters are not part of Validate(); check the selection here.
    const auto* layer = GetParameter("Input").SelectedLayer();
    if (!layer) {
        Messages().Info("Input layer is not selected.");
        return false;
    }
    const auto* input = dynamic_cast<const data::PointDatasource*>(layer->GetDatasource());
    if (!input || input->IsDisposed()) {
        Messages().Info("Input layer must be a point layer: " + layer->Name());
        return false;
    }

    const double dx = GetParameter("OffsetX").AsDouble();
    const double dy = GetParameter("OffsetY").AsDouble();
    auto output = std::make_unique<data::PointDatasource>();
    for (const auto& point : input->Points()) {
        output->AddPoint(data::Point{point.x + dx, point.y + dy});
    }
    return HandleOutput(std::move(output), GetParameter("Output").AsOutput());
}

}  // namespace gistools::tools
