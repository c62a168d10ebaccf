#pragma once

#include <string>

namespace gistools::data {

// File-level operations on datasets that may span several files (shapefiles keep
// .shx/.dbf/.prj next to the .shp).
class GeoSource {
public:
    static bool Exists(const std::string& filename);

    // Removes |filename| and any sidecar files with the same stem. Returns true if nothing
    // is left on disk afterwards, including when nothing existed in the first place.
    static bool Remove(const std::string& filename);
};

}  // namespace gistools::data
