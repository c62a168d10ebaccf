#pragma once

#include <memory>
#include <string>
#include <vector>

#include "services/datasource.hpp"

namespace gistools::services {

class Layer {
public:
    Layer(int handle, std::string name, std::unique_ptr<Datasource> datasource, std::string filename = {})
        : handle_(handle)
        , name_(std::move(name))
        , filename_(std::move(filename))
        , datasource_(std::move(datasource)) {}

    int Handle() const { return handle_; }
    const std::string& Name() const { return name_; }
    void SetName(std::string name) { name_ = std::move(name); }

    // Empty for memory layers.
    const std::string& Filename() const { return filename_; }
    Datasource* GetDatasource() const { return datasource_.get(); }

private:
    int handle_;
    std::string name_;
    std::string filename_;
    std::unique_ptr<Datasource> datasource_;
};

// Read access to the live layers of the map.
class LayerCollection {
public:
    virtual ~LayerCollection() = default;

    // Returns nullptr if no layer has |handle|.
    virtual Layer* ItemByHandle(int handle) = 0;
    virtual std::vector<int> Handles() const = 0;
    virtual std::size_t Count() const = 0;
};

}  // namespace gistools::services
