// Tests for tool registration, description and execution through the registry.

#include <memory>
#include <sstream>
#include <string>

#include "data/point_datasource.hpp"
#include "services/console_message_service.hpp"
#include "services/layer_registry.hpp"
#include "test_support.hpp"
#include "tools/random_points.hpp"
#include "tools/tool_registry.hpp"
#include "tools/translate_layer.hpp"

using gistools::data::Point;
using gistools::data::PointDatasource;
using gistools::services::AppContext;
using gistools::services::LayerRegistry;
using gistools::tools::RandomPointsTool;
using gistools::tools::ToolRegistry;
using gistools::tools::TranslateLayerTool;
using test_support::report;

namespace test_tool_registry {

struct Fixture {
    test_support::RecordingMessageService messages;
    LayerRegistry layers;
    AppContext context{&layers, &messages, &layers};
    ToolRegistry registry{&context};

    Fixture() {
        auto random_points = std::make_unique<RandomPointsTool>(1000);
        random_points->SetIdentity({"gistools.builtin", "gistools", "1.0"});
        registry.Register(std::move(random_points));
        registry.Register(std::make_unique<TranslateLayerTool>());
    }

    bool has_message(const std::string &needle) const {
        for (const auto &message : messages.messages) {
            if (message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

static const PointDatasource *points_of(LayerRegistry &layers, int handle) {
    auto *layer = layers.ItemByHandle(handle);
    return layer ? dynamic_cast<const PointDatasource *>(layer->GetDatasource()) : nullptr;
}

// Test: Unknown tool names are reported, not thrown.
static bool test_execute_unknown_tool() {
    Fixture fixture;
    bool success = fixture.registry.Execute("buffer", {}) == "Error: Tool 'buffer' not found"
        && fixture.registry.Get("buffer") == nullptr && !fixture.registry.Has("buffer");
    return report(success, "Execute on an unknown tool returns an error text");
}

// Test: Malformed host input stops before validation.
static bool test_execute_bad_input() {
    Fixture fixture;
    const auto result = fixture.registry.Execute("random_points", {{"PointCount", "lots"}});
    const auto unknown = fixture.registry.Execute("random_points", {{"Colour", "red"}});
    bool success = result.rfind("Error: Invalid integer value", 0) == 0 && unknown == "Error: Unknown parameter: Colour"
        && fixture.layers.Count() == 0;
    return report(success, "Malformed or unknown parameter values are rejected");
}

// Test: Validation failure is surfaced through the message service.
static bool test_execute_validation_failure() {
    Fixture fixture;
    const auto result = fixture.registry.Execute("random_points", {{"PointCount", "5000"}});
    bool success = result == "Error: validation failed"
        && fixture.has_message("Number of points must be between 1 and 1000.") && fixture.layers.Count() == 0;
    return report(success, "Out-of-range value fails validation and nothing is produced");
}

// Test: Random points written to disk and loaded back into the map.
static bool test_random_points_to_disk() {
    Fixture fixture;
    test_support::TempDir dir("gistools_registry");
    const auto target = dir.file("pts.geojson");
    const auto result = fixture.registry.Execute("random_points", {
        {"PointCount", "25"}, {"MinX", "10"}, {"MaxX", "20"}, {"MinY", "-5"}, {"MaxY", "5"},
        {"Seed", "7"}, {"Output", target}});
    const auto *points = points_of(fixture.layers, fixture.layers.LastLayerHandle());
    bool success = result == "OK" && fixture.layers.Count() == 1 && points && points->Count() == 25;
    if (success) {
        const auto bounds = points->Bounds();
        success = bounds.min_x >= 10 && bounds.max_x <= 20 && bounds.min_y >= -5 && bounds.max_y <= 5
            && fixture.layers.ItemByHandle(fixture.layers.LastLayerHandle())->Name() == "pts";
    }
    return report(success, "random_points saves a GeoJSON file and adds it to the map");
}

// Test: Existing output is kept unless overwrite is requested.
static bool test_random_points_existing_output() {
    Fixture fixture;
    test_support::TempDir dir("gistools_registry");
    const auto target = dir.file("pts.geojson");
    test_support::write_file(target, "keep");
    const auto first = fixture.registry.Execute("random_points", {{"Output", target}});
    const auto second = fixture.registry.Execute("random_points", {
        {"Output", target}, {"Output.overwrite", "true"}, {"Output.add_to_map", "false"}});
    bool success = first == "Error: Tool 'random_points' failed" && second == "OK"
        && fixture.has_message("Failed to overwrite existing file") && test_support::read_file(target) != "keep"
        && fixture.layers.Count() == 0;
    return report(success, "Existing file blocks output until Output.overwrite is set");
}

// Test: An inverted extent fails at run time.
static bool test_random_points_empty_extent() {
    Fixture fixture;
    const auto result = fixture.registry.Execute("random_points", {
        {"MinX", "50"}, {"MaxX", "10"}, {"Output", "scratch"}, {"Output.memory", "true"}});
    bool success = result == "Error: Tool 'random_points' failed" && fixture.has_message("Extent is empty")
        && fixture.layers.Count() == 0;
    return report(success, "random_points refuses an extent with min > max");
}

// Test: A tool built with a point limit below 1 still has its count slot and runs.
static bool test_random_points_limit_below_one() {
    test_support::RecordingMessageService messages;
    LayerRegistry layers;
    AppContext context{&layers, &messages, &layers};
    ToolRegistry registry(&context);
    registry.Register(std::make_unique<RandomPointsTool>(0));
    const auto result = registry.Execute("random_points", {{"Output", "Scratch"}, {"Output.memory", "true"}});
    const auto *points = points_of(layers, layers.LastLayerHandle());
    const auto described = registry.DescribeJson("random_points");
    bool success = result == "OK" && points && points->Count() == 1
        && described["parameters"][0]["name"] == "PointCount" && described["parameters"][0]["maximum"] == 1;
    return report(success, "random_points with a limit of 0 is clamped to one point instead of losing the slot");
}

// Test: The console message service writes each message on its own line.
static bool test_console_messages() {
    std::ostringstream out;
    gistools::services::ConsoleMessageService console(out);
    LayerRegistry layers;
    AppContext context{&layers, &console, &layers};
    ToolRegistry registry(&context);
    registry.Register(std::make_unique<RandomPointsTool>(10));
    const auto result = registry.Execute("random_points", {{"PointCount", "11"}});
    bool success = result == "Error: validation failed" && out.str() == "Number of points must be between 1 and 10.\n";
    return report(success, "ConsoleMessageService prints validation messages to its stream");
}

// Test: Translate a loaded layer into a named memory layer.
static bool test_translate_layer_to_memory() {
    Fixture fixture;
    test_support::TempDir dir("gistools_registry");
    const auto source_file = dir.file("source.geojson");
    PointDatasource source({Point{1, 2}, Point{3, 4}});
    bool success = source.SaveAs(source_file) && fixture.layers.AddLayersFromFilename(source_file);
    const int input_handle = fixture.layers.LastLayerHandle();

    const auto result = fixture.registry.Execute("translate_layer", {
        {"Input", std::to_string(input_handle)}, {"OffsetX", "10"}, {"OffsetY", "-1"},
        {"Output", "Shifted"}, {"Output.memory", "true"}});
    const int output_handle = fixture.layers.LastLayerHandle();
    const auto *points = points_of(fixture.layers, output_handle);
    success = success && result == "OK" && output_handle != input_handle && points && points->Count() == 2
        && points->Points()[0].x == 11 && points->Points()[0].y == 1 && points->Points()[1].x == 13
        && fixture.layers.ItemByHandle(output_handle)->Name() == "Shifted";
    return report(success, "translate_layer shifts a loaded layer into a named memory layer");
}

// Test: Translate without a selected layer fails in Run.
static bool test_translate_requires_input() {
    Fixture fixture;
    const auto result = fixture.registry.Execute("translate_layer", {{"Output", "x"}, {"Output.memory", "true"}});
    bool success = result == "Error: Tool 'translate_layer' failed" && fixture.has_message("Input layer is not selected.");
    return report(success, "translate_layer without an input layer reports the missing selection");
}

// Test: Definitions are sorted and carry ordered parameter metadata.
static bool test_definitions() {
    Fixture fixture;
    const auto names = fixture.registry.List();
    const auto defs = fixture.registry.GetDefinitions();
    const auto described = fixture.registry.DescribeJson("random_points");
    bool success = names.size() == 2 && names[0] == "random_points" && names[1] == "translate_layer"
        && defs.size() == 2 && defs[0].parameters.size() == 7 && defs[0].parameters[0]["name"] == "PointCount"
        && defs[0].parameters[0]["maximum"] == 1000 && defs[1].parameters[0]["layerType"] == "vector"
        && described["plugin"]["name"] == "gistools.builtin" && fixture.registry.DescribeJson("none").is_null();
    return report(success, "GetDefinitions and DescribeJson expose sorted tool metadata");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_execute_unknown_tool();
    all_passed &= test_execute_bad_input();
    all_passed &= test_execute_validation_failure();
    all_passed &= test_random_points_to_disk();
    all_passed &= test_random_points_existing_output();
    all_passed &= test_random_points_empty_extent();
    all_passed &= test_random_points_limit_below_one();
    all_passed &= test_console_messages();
    all_passed &= test_translate_layer_to_memory();
    all_passed &= test_translate_requires_input();
    all_passed &= test_definitions();
    return all_passed;
}

} // namespace test_tool_registry
