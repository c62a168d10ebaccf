#pragma once

#include <memory>
#include <string>

#include "services/datasource.hpp"
#include "services/layer.hpp"

namespace gistools::services {

class MessageService {
public:
    virtual ~MessageService() = default;
    virtual void Info(const std::string& text) = 0;
};

class LayerService {
public:
    virtual ~LayerService() = default;

    virtual bool AddLayersFromFilename(const std::string& filename) = 0;

    // Takes ownership. On failure the datasource is released by the service.
    virtual bool AddDatasource(std::unique_ptr<Datasource> datasource) = 0;

    // Handle of the most recently added layer, -1 if none was added.
    virtual int LastLayerHandle() const = 0;
};

// Services a tool is bound to. Nothing here is owned by the tool.
struct AppContext {
    LayerCollection* layers = nullptr;
    MessageService* messages = nullptr;
    LayerService* layer_service = nullptr;
};

}  // namespace gistools::services
