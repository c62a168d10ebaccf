#pragma once

#include <string>

namespace gistools::parameters {

// Destination of a dataset produced by a tool.
struct OutputLayerInfo {
    // File path for disk outputs, display name for memory layers.
    std::string name;
    bool memory_layer = false;
    bool overwrite = false;
    bool add_to_map = true;

    // Checks that the destination is well-formed. Whether an existing file may be
    // replaced is decided when the output is written, not here.
    bool Validate(std::string& error) const;
};

}  // namespace gistools::parameters
