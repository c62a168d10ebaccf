#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "services/services.hpp"

namespace gistools::services {

// Live layer registry of the host: the single owner of registered datasources.
class LayerRegistry : public LayerCollection, public LayerService {
public:
    using Loader = std::function<std::unique_ptr<Datasource>(const std::string& filename, std::string& error)>;

    // With no loader, files are opened as GeoJSON point sets.
    explicit LayerRegistry(Loader loader = {});

    Layer* ItemByHandle(int handle) override;
    std::vector<int> Handles() const override;
    std::size_t Count() const override { return layers_.size(); }

    bool AddLayersFromFilename(const std::string& filename) override;
    bool AddDatasource(std::unique_ptr<Datasource> datasource) override;
    int LastLayerHandle() const override { return last_handle_; }

private:
    int Add(std::string name, std::unique_ptr<Datasource> datasource, std::string filename);

    Loader loader_;
    std::map<int, std::unique_ptr<Layer>> layers_;
    int next_handle_ = 0;
    int last_handle_ = -1;
};

}  // namespace gistools::services
