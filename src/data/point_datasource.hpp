#pragma once

#include <memory>
#include <string>
#include <vector>

#include "services/datasource.hpp"

namespace gistools::data {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

struct Extent {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    bool IsValid() const { return min_x <= max_x && min_y <= max_y; }
};

// In-memory point feature set, persisted as a GeoJSON FeatureCollection.
class PointDatasource : public services::Datasource {
public:
    PointDatasource() = default;
    explicit PointDatasource(std::vector<Point> points);

    static std::unique_ptr<PointDatasource> Load(const std::string& filename, std::string& error);

    services::DatasourceKind Kind() const override { return services::DatasourceKind::kVector; }
    bool SaveAs(const std::string& filename) override;
    void Dispose() override;
    bool IsDisposed() const override { return disposed_; }
    std::string LastError() const override { return last_error_; }

    void AddPoint(const Point& point);
    const std::vector<Point>& Points() const { return points_; }
    std::size_t Count() const { return points_.size(); }
    Extent Bounds() const;

private:
    std::vector<Point> points_;
    bool disposed_ = false;
    std::string last_error_;
};

}  // namespace gistools::data
