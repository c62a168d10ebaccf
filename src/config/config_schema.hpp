#pragma once

#include <string>

namespace gistools::config {

struct LoggingConfig {
    std::string level = "info";
};

// Defaults for output layer flags when the caller does not set them.
struct OutputConfig {
    std::string directory;
    bool overwrite = false;
    bool add_to_map = true;
    bool memory_layer = false;
};

struct ToolsConfig {
    int random_points_max = 100000;
};

struct Config {
    LoggingConfig logging;
    OutputConfig output;
    ToolsConfig tools;
};

}  // namespace gistools::config
