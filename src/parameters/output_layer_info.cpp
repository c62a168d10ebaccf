#include "parameters/output_layer_info.hpp"

#include <filesystem>
#include <system_error>

#include "utils/common.hpp"

namespace gistools::parameters {

bool OutputLayerInfo::Validate(std::string& error) const {
    if (utils::Trim(name).empty()) {
        error = memory_layer ? "Name of the output layer is empty." : "Output filename is empty.";
        return false;
    }
    if (memory_layer) {
        return true;
    }

    const std::filesystem::path path(name);
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        error = "Output path is a directory: " + name;
        return false;
    }
    const auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        error = "Output directory does not exist: " + parent.string();
        return false;
    }
    if (!path.has_filename()) {
        error = "Output filename is empty.";
        return false;
    }
    return true;
}

}  // namespace gistools::parameters
