#include "services/layer_registry.hpp"

#include <filesystem>

#include "data/point_datasource.hpp"
#include "utils/logging.hpp"

namespace gistools::services {
namespace {

std::unique_ptr<Datasource> LoadPointFile(const std::string& filename, std::string& error) {
    return data::PointDatasource::Load(filename, error);
}

}  // namespace

LayerRegistry::LayerRegistry(Loader loader)
    : loader_(loader ? std::move(loader) : Loader(LoadPointFile)) {}

Layer* LayerRegistry::ItemByHandle(int handle) {
    auto it = layers_.find(handle);
    if (it == layers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<int> LayerRegistry::Handles() const {
    std::vector<int> handles;
    handles.reserve(layers_.size());
    for (const auto& [handle, _] : layers_) {
        handles.push_back(handle);
    }
    return handles;
}

bool LayerRegistry::AddLayersFromFilename(const std::string& filename) {
    std::string error;
    auto datasource = loader_(filename, error);
    if (!datasource) {
        utils::Logger::Current().Error("layers", "failed to open " + filename + ": " + error);
        return false;
    }
    const auto name = std::filesystem::path(filename).stem().string();
    Add(name, std::move(datasource), filename);
    return true;
}

bool LayerRegistry::AddDatasource(std::unique_ptr<Datasource> datasource) {
    if (!datasource || datasource->IsDisposed()) {
        utils::Logger::Current().Error("layers", "cannot add an empty or disposed datasource");
        if (datasource) {
            datasource->Dispose();
        }
        return false;
    }
    Add("Layer " + std::to_string(next_handle_), std::move(datasource), {});
    return true;
}

int LayerRegistry::Add(std::string name, std::unique_ptr<Datasource> datasource, std::string filename) {
    const int handle = next_handle_++;
    layers_.emplace(handle, std::make_unique<Layer>(handle, std::move(name), std::move(datasource), std::move(filename)));
    last_handle_ = handle;
    utils::Logger::Current().Debug("layers", "added layer handle=" + std::to_string(handle));
    return handle;
}

}  // namespace gistools::services
