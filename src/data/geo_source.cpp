#include "data/geo_source.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gistools::data {
namespace {

const std::vector<std::string>& ShapefileSidecars() {
    static const std::vector<std::string> kExtensions = {".shx", ".dbf", ".prj", ".cpg", ".qix", ".sbn", ".sbx"};
    return kExtensions;
}

bool RemoveFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }
    if (!std::filesystem::remove(path, ec) || ec) {
        utils::Logger::Current().Error("geosource", "failed to remove " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

}  // namespace

bool GeoSource::Exists(const std::string& filename) {
    std::error_code ec;
    return !filename.empty() && std::filesystem::exists(filename, ec);
}

bool GeoSource::Remove(const std::string& filename) {
    if (filename.empty()) {
        return false;
    }
    const std::filesystem::path path(filename);
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        utils::Logger::Current().Error("geosource", "refusing to remove directory " + filename);
        return false;
    }
    if (!RemoveFile(path)) {
        return false;
    }
    if (utils::ToLower(path.extension().string()) != ".shp") {
        return true;
    }
    bool removed = true;
    for (const auto& extension : ShapefileSidecars()) {
        auto sidecar = path;
        sidecar.replace_extension(extension);
        removed = RemoveFile(sidecar) && removed;
    }
    return removed;
}

}  // namespace gistools::data
