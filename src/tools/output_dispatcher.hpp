#pragma once

#include <memory>
#include <string>

#include "parameters/output_layer_info.hpp"
#include "services/services.hpp"

namespace gistools::tools {

// Commits a dataset produced by a tool, either to a file or to the live layer registry.
//
// The dispatcher owns the datasource once HandleOutput is called. It calls Dispose() on
// every path except a successful memory-layer registration, where ownership moves on to
// the layer service. Conflicts and I/O problems are reported as false, never thrown.
class OutputDispatcher {
public:
    OutputDispatcher(services::LayerService& layer_service,
                     services::LayerCollection& layers,
                     services::MessageService* messages = nullptr);

    // Throws std::invalid_argument for a null datasource.
    bool HandleOutput(std::unique_ptr<services::Datasource> datasource,
                      const parameters::OutputLayerInfo& info);

private:
    bool HandleDiskOutput(std::unique_ptr<services::Datasource> datasource,
                          const parameters::OutputLayerInfo& info);
    bool HandleMemoryOutput(std::unique_ptr<services::Datasource> datasource,
                            const parameters::OutputLayerInfo& info);
    bool HandleOverwriteFailure(const std::string& filename);

    services::LayerService& layer_service_;
    services::LayerCollection& layers_;
    services::MessageService* messages_ = nullptr;
};

}  // namespace gistools::tools
