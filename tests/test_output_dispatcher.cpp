// Tests for committing tool output to disk or to the in-memory layer registry.

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "parameters/output_layer_info.hpp"
#include "test_support.hpp"
#include "tools/output_dispatcher.hpp"

using gistools::parameters::OutputLayerInfo;
using gistools::tools::OutputDispatcher;
using gistools::utils::LogLevel;
using test_support::FakeDatasource;
using test_support::report;

namespace test_output_dispatcher {

static OutputLayerInfo make_info(const std::string &name, bool memory, bool overwrite, bool add_to_map) {
    OutputLayerInfo info;
    info.name = name;
    info.memory_layer = memory;
    info.overwrite = overwrite;
    info.add_to_map = add_to_map;
    return info;
}

// Test: Existing file without overwrite is left alone and nothing is registered.
static bool test_disk_existing_no_overwrite() {
    test_support::TempDir dir("gistools_dispatch");
    const auto target = dir.file("out.shp");
    test_support::write_file(target, "original");

    test_support::FakeLayerService layers;
    test_support::RecordingMessageService messages;
    OutputDispatcher dispatcher(layers, layers, &messages);
    int disposed = 0;
    auto source = std::make_unique<FakeDatasource>(&disposed);

    const bool ok = dispatcher.HandleOutput(std::move(source), make_info(target, false, false, true));
    bool success = !ok && test_support::read_file(target) == "original" && layers.filenames.empty()
        && layers.datasource_calls == 0 && disposed == 1 && messages.messages.size() == 1;
    return report(success, "Existing target + Overwrite=false: false, file untouched, no registration");
}

// Test: Overwrite replaces the file, disposes once and skips the map when not requested.
static bool test_disk_overwrite_success() {
    test_support::TempDir dir("gistools_dispatch");
    const auto target = dir.file("out.geojson");
    test_support::write_file(target, "original");

    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed),
                                            make_info(target, false, true, false));
    bool success = ok && test_support::read_file(target) == "new-content" && disposed == 1 && layers.filenames.empty();
    return report(success, "Overwrite=true: file replaced, handle disposed once, true returned");
}

// Test: Overwrite of a shapefile removes its sidecar files too.
static bool test_disk_overwrite_removes_sidecars() {
    test_support::TempDir dir("gistools_dispatch");
    const auto target = dir.file("roads.shp");
    test_support::write_file(target, "shp");
    test_support::write_file(dir.file("roads.dbf"), "dbf");
    test_support::write_file(dir.file("roads.shx"), "shx");

    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(), make_info(target, false, true, false));
    bool success = ok && !std::filesystem::exists(dir.file("roads.dbf")) && !std::filesystem::exists(dir.file("roads.shx"))
        && std::filesystem::exists(target);
    return report(success, "Overwriting a .shp removes stale sidecar files");
}

// Test: A target that cannot be removed blocks the overwrite before anything is saved.
static bool test_disk_overwrite_remove_fails() {
    test_support::TempDir dir("gistools_dispatch");
    const auto target = dir.file("out.shp");
    std::filesystem::create_directories(target);

    test_support::FakeLayerService layers;
    test_support::RecordingMessageService messages;
    OutputDispatcher dispatcher(layers, layers, &messages);
    test_support::LogCapture logs;
    int disposed = 0;
    int saved = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed, true, &saved),
                                            make_info(target, false, true, true));
    bool success = !ok && saved == 0 && disposed == 1 && layers.filenames.empty() && layers.datasource_calls == 0
        && std::filesystem::is_directory(target) && messages.messages.size() == 1
        && messages.messages[0] == "Failed to overwrite existing file: " + target
        && logs.contains(LogLevel::kWarn, "Failed to overwrite existing file");
    return report(success, "Overwrite=true with an unremovable target: false, nothing saved or registered");
}

// Test: A new file is saved and registered when AddToMap is set.
static bool test_disk_new_file_added_to_map() {
    test_support::TempDir dir("gistools_dispatch");
    const auto target = dir.file("fresh.geojson");

    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed),
                                            make_info(target, false, false, true));
    bool success = ok && std::filesystem::exists(target) && disposed == 1 && layers.filenames.size() == 1
        && layers.filenames[0] == target;
    return report(success, "New disk output is saved, disposed and added from its filename");
}

// Test: Registration result becomes the outcome of the disk path.
static bool test_disk_registration_failure() {
    test_support::TempDir dir("gistools_dispatch");
    test_support::FakeLayerService layers;
    layers.accept = false;
    OutputDispatcher dispatcher(layers, layers);
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(),
                                            make_info(dir.file("a.geojson"), false, false, true));
    return report(!ok && layers.filenames.size() == 1, "Disk output returns the layer service result when AddToMap");
}

// Test: Save failure is logged with the datasource error.
static bool test_disk_save_failure() {
    test_support::TempDir dir("gistools_dispatch");
    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    test_support::LogCapture logs;
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed, false),
                                            make_info(dir.file("b.geojson"), false, false, true));
    bool success = !ok && disposed == 1 && layers.filenames.empty()
        && logs.contains(LogLevel::kError, "Failed to save datasource: disk full");
    return report(success, "Save failure logs LastError and returns false");
}

// Test: Memory output without AddToMap is discarded with a warning.
static bool test_memory_not_added() {
    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    test_support::LogCapture logs;
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed),
                                            make_info("scratch", true, false, false));
    bool success = !ok && disposed == 1 && layers.datasource_calls == 0
        && logs.contains(LogLevel::kWarn, "wasn't added to the map");
    return report(success, "Memory output with AddToMap=false: false, disposed, warning");
}

// Test: Memory output is registered and renamed.
static bool test_memory_added_and_named() {
    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed),
                                            make_info("Random points", true, false, true));
    auto *layer = layers.ItemByHandle(layers.LastLayerHandle());
    bool success = ok && layer && layer->Name() == "Random points" && disposed == 0 && layers.datasource_calls == 1;
    return report(success, "Memory output with AddToMap=true is registered under the requested name");
}

// Test: A refused memory registration is a failure.
static bool test_memory_registration_refused() {
    test_support::FakeLayerService layers;
    layers.accept = false;
    OutputDispatcher dispatcher(layers, layers);
    int disposed = 0;
    const bool ok = dispatcher.HandleOutput(std::make_unique<FakeDatasource>(&disposed),
                                            make_info("Refused", true, false, true));
    return report(!ok && disposed == 1, "Refused memory registration returns false and the source is released once");
}

// Test: A null datasource is a programming error.
static bool test_null_datasource_throws() {
    test_support::FakeLayerService layers;
    OutputDispatcher dispatcher(layers, layers);
    bool threw = false;
    try {
        dispatcher.HandleOutput(nullptr, make_info("x", true, false, true));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    return report(threw, "HandleOutput throws std::invalid_argument for a null datasource");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_disk_existing_no_overwrite();
    all_passed &= test_disk_overwrite_success();
    all_passed &= test_disk_overwrite_removes_sidecars();
    all_passed &= test_disk_overwrite_remove_fails();
    all_passed &= test_disk_new_file_added_to_map();
    all_passed &= test_disk_registration_failure();
    all_passed &= test_disk_save_failure();
    all_passed &= test_memory_not_added();
    all_passed &= test_memory_added_and_named();
    all_passed &= test_memory_registration_refused();
    all_passed &= test_null_datasource_throws();
    return all_passed;
}

} // namespace test_output_dispatcher
