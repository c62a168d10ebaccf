#include "data/point_datasource.hpp"

#include <algorithm>
#include <fstream>

#include "nlohmann/json.hpp"

namespace gistools::data {
namespace {

nlohmann::json PointToFeature(const Point& point, std::size_t id) {
    return {
        {"type", "Feature"},
        {"id", id},
        {"geometry", {
            {"type", "Point"},
            {"coordinates", {point.x, point.y}}
        }},
        {"properties", nlohmann::json::object()}
    };
}

}  // namespace

PointDatasource::PointDatasource(std::vector<Point> points)
    : points_(std::move(points)) {}

std::unique_ptr<PointDatasource> PointDatasource::Load(const std::string& filename, std::string& error) {
    std::ifstream input(filename);
    if (!input.is_open()) {
        error = "failed to open " + filename;
        return nullptr;
    }
    auto json = nlohmann::json::parse(input, nullptr, false);
    if (json.is_discarded() || !json.is_object() || json.value("type", "") != "FeatureCollection") {
        error = "not a GeoJSON FeatureCollection: " + filename;
        return nullptr;
    }
    auto source = std::make_unique<PointDatasource>();
    if (json.contains("features") && json["features"].is_array()) {
        for (const auto& feature : json["features"]) {
            if (!feature.contains("geometry") || !feature["geometry"].is_object()) {
                continue;
            }
            const auto& geometry = feature["geometry"];
            if (geometry.value("type", "") != "Point" || !geometry.contains("coordinates")) {
                continue;
            }
            const auto& coords = geometry["coordinates"];
            if (!coords.is_array() || coords.size() < 2 || !coords[0].is_number() || !coords[1].is_number()) {
                continue;
            }
            source->AddPoint(Point{coords[0].get<double>(), coords[1].get<double>()});
        }
    }
    return source;
}

bool PointDatasource::SaveAs(const std::string& filename) {
    if (disposed_) {
        last_error_ = "datasource is disposed";
        return false;
    }
    nlohmann::json features = nlohmann::json::array();
    for (std::size_t i = 0; i < points_.size(); ++i) {
        features.push_back(PointToFeature(points_[i], i));
    }
    nlohmann::json collection = {
        {"type", "FeatureCollection"},
        {"features", std::move(features)}
    };

    std::ofstream output(filename, std::ios::out | std::ios::trunc);
    if (!output.is_open()) {
        last_error_ = "failed to open " + filename + " for writing";
        return false;
    }
    output << collection.dump(2);
    if (!output.good()) {
        last_error_ = "failed to write " + filename;
        return false;
    }
    last_error_.clear();
    return true;
}

void PointDatasource::Dispose() {
    points_.clear();
    points_.shrink_to_fit();
    disposed_ = true;
}

void PointDatasource::AddPoint(const Point& point) {
    points_.push_back(point);
}

Extent PointDatasource::Bounds() const {
    if (points_.empty()) {
        return {};
    }
    Extent extent{points_.front().x, points_.front().y, points_.front().x, points_.front().y};
    for (const auto& point : points_) {
        extent.min_x = std::min(extent.min_x, point.x);
        extent.min_y = std::min(extent.min_y, point.y);
        extent.max_x = std::max(extent.max_x, point.x);
        extent.max_y = std::max(extent.max_y, point.y);
    }
    return extent;
}

}  // namespace gistools::data
