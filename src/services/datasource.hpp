#pragma once

#include <string>

namespace gistools::services {

enum class DatasourceKind {
    kVector,
    kRaster
};

inline const char* ToString(DatasourceKind kind) {
    switch (kind) {
        case DatasourceKind::kVector: return "vector";
        case DatasourceKind::kRaster: return "raster";
    }
    return "unknown";
}

// Handle to a produced or consumed geographic dataset. Owned through std::unique_ptr:
// by the producing tool, then the output dispatcher, then (for memory layers) the
// layer registry.
class Datasource {
public:
    virtual ~Datasource() = default;

    virtual DatasourceKind Kind() const = 0;

    // Writes the dataset to |filename|. On failure returns false and LastError() describes it.
    virtual bool SaveAs(const std::string& filename) = 0;

    // Releases the in-memory data. Safe to call more than once.
    virtual void Dispose() = 0;
    virtual bool IsDisposed() const = 0;

    virtual std::string LastError() const = 0;
};

}  // namespace gistools::services
