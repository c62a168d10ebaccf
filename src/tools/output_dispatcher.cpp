#include "tools/output_dispatcher.hpp"

#include <stdexcept>

#include "data/geo_source.hpp"
#include "utils/logging.hpp"

namespace gistools::tools {
namespace {

void Release(std::unique_ptr<services::Datasource>& datasource) {
    if (datasource) {
        datasource->Dispose();
        datasource.reset();
    }
}

}  // namespace

OutputDispatcher::OutputDispatcher(services::LayerService& layer_service,
                                   services::LayerCollection& layers,
                                   services::MessageService* messages)
    : layer_service_(layer_service)
    , layers_(layers)
    , messages_(messages) {}

bool OutputDispatcher::HandleOutput(std::unique_ptr<services::Datasource> datasource,
                                    const parameters::OutputLayerInfo& info) {
    if (!datasource) {
        throw std::invalid_argument("datasource");
    }
    if (info.memory_layer) {
        return HandleMemoryOutput(std::move(datasource), info);
    }
    return HandleDiskOutput(std::move(datasource), info);
}

bool OutputDispatcher::HandleDiskOutput(std::unique_ptr<services::Datasource> datasource,
                                        const parameters::OutputLayerInfo& info) {
    auto& logger = utils::Logger::Current();
    const auto& filename = info.name;

    if (data::GeoSource::Exists(filename)) {
        if (!info.overwrite) {
            Release(datasource);
            return HandleOverwriteFailure(filename);
        }
        if (!data::GeoSource::Remove(filename)) {
            Release(datasource);
            return HandleOverwriteFailure(filename);
        }
    }

    if (!datasource->SaveAs(filename)) {
        logger.Error("output", "Failed to save datasource: " + datasource->LastError());
        Release(datasource);
        return false;
    }
    logger.Info("output", "Layer (" + filename + ") is created.");

    // The file is the durable copy from here on.
    Release(datasource);

    if (info.add_to_map) {
        return layer_service_.AddLayersFromFilename(filename);
    }
    return true;
}

bool OutputDispatcher::HandleMemoryOutput(std::unique_ptr<services::Datasource> datasource,
                                          const parameters::OutputLayerInfo& info) {
    auto& logger = utils::Logger::Current();
    if (!info.add_to_map) {
        Release(datasource);
        logger.Warn("output", "Memory layer created by the tool wasn't added to the map.");
        return false;
    }

    if (!layer_service_.AddDatasource(std::move(datasource))) {
        logger.Error("output", "Failed to add memory layer to the map: " + info.name);
        return false;
    }

    const int handle = layer_service_.LastLayerHandle();
    if (auto* layer = layers_.ItemByHandle(handle)) {
        layer->SetName(info.name);
    } else {
        logger.Warn("output", "Added layer not found by handle " + std::to_string(handle));
    }
    return true;
}

bool OutputDispatcher::HandleOverwriteFailure(const std::string& filename) {
    utils::Logger::Current().Warn("output", "Failed to overwrite existing file: " + filename);
    if (messages_) {
        messages_->Info("Failed to overwrite existing file: " + filename);
    }
    return false;
}

}  // namespace gistools::tools
