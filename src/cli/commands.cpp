#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_loader.hpp"
#include "services/console_message_service.hpp"
#include "services/layer_registry.hpp"
#include "tools/random_points.hpp"
#include "tools/tool_registry.hpp"
#include "tools/translate_layer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

struct CliArgs {
    std::string config_path;
    std::vector<std::string> layer_files;
    std::vector<std::string> positional;
};

void PrintUsage() {
    std::cout << "Usage: gistools [--config FILE] [--layer FILE]... list\n"
              << "       gistools [--config FILE] describe TOOL\n"
              << "       gistools [--config FILE] [--layer FILE]... run TOOL [SLOT=VALUE]...\n"
              << "\n"
              << "Output flags: SLOT.overwrite=BOOL SLOT.memory=BOOL SLOT.add_to_map=BOOL" << std::endl;
}

bool ParseArgs(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "--layer") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            if (arg == "--config") {
                args.config_path = argv[++i];
            } else {
                args.layer_files.push_back(argv[++i]);
            }
            continue;
        }
        args.positional.push_back(arg);
    }
    return !args.positional.empty();
}

void RegisterDefaultTools(gistools::tools::ToolRegistry& registry, const gistools::config::Config& config) {
    const gistools::tools::PluginIdentity identity{"gistools.builtin", "gistools", "1.0"};

    auto random_points = std::make_unique<gistools::tools::RandomPointsTool>(config.tools.random_points_max);
    random_points->SetIdentity(identity);
    registry.Register(std::move(random_points));

    auto translate = std::make_unique<gistools::tools::TranslateLayerTool>();
    translate->SetIdentity(identity);
    registry.Register(std::move(translate));
}

// Fills output flags the user did not pass from the configuration and places relative
// disk outputs under the configured directory.
void ApplyOutputDefaults(const gistools::tools::GisTool& tool,
                         const gistools::config::OutputConfig& output,
                         std::unordered_map<std::string, std::string>& params) {
    for (const auto& parameter : tool.Parameters()) {
        if (!parameter->IsOutputLayer()) {
            continue;
        }
        const auto& slot = parameter->Name();
        params.emplace(slot + ".overwrite", output.overwrite ? "true" : "false");
        params.emplace(slot + ".add_to_map", output.add_to_map ? "true" : "false");
        params.emplace(slot + ".memory", output.memory_layer ? "true" : "false");

        bool memory = false;
        gistools::utils::TryParseBool(params[slot + ".memory"], memory);
        if (memory || output.directory.empty()) {
            continue;
        }
        auto it = params.find(slot);
        const std::string filename = it != params.end() ? it->second : parameter->AsOutput().name;
        if (!filename.empty() && std::filesystem::path(filename).is_relative()) {
            params[slot] = (std::filesystem::path(output.directory) / filename).string();
        }
    }
}

void PrintLayers(gistools::services::LayerRegistry& layers) {
    for (const auto handle : layers.Handles()) {
        const auto* layer = layers.ItemByHandle(handle);
        if (!layer) {
            continue;
        }
        std::cout << "layer " << handle << ": " << layer->Name();
        if (!layer->Filename().empty()) {
            std::cout << " (" << layer->Filename() << ")";
        } else {
            std::cout << " (memory)";
        }
        std::cout << std::endl;
    }
}

int RunTool(gistools::tools::ToolRegistry& registry,
            gistools::services::LayerRegistry& layers,
            const gistools::config::Config& config,
            const std::vector<std::string>& positional) {
    if (positional.size() < 2) {
        PrintUsage();
        return 1;
    }
    const auto& name = positional[1];
    auto* tool = registry.Get(name);
    if (!tool) {
        std::cout << "Error: Tool '" << name << "' not found" << std::endl;
        return 1;
    }

    std::unordered_map<std::string, std::string> params;
    for (std::size_t i = 2; i < positional.size(); ++i) {
        const auto& item = positional[i];
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cout << "Error: expected SLOT=VALUE, got '" << item << "'" << std::endl;
            return 1;
        }
        params[item.substr(0, eq)] = item.substr(eq + 1);
    }
    ApplyOutputDefaults(*tool, config.output, params);

    const auto result = registry.Execute(name, params);
    std::cout << result << std::endl;
    PrintLayers(layers);
    return result == "OK" ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!ParseArgs(argc, argv, args)) {
        PrintUsage();
        return 1;
    }

    const auto config = args.config_path.empty()
        ? gistools::config::LoadConfig()
        : gistools::config::LoadConfigFrom(args.config_path);
    gistools::utils::LogConfig log_config;
    log_config.min_level = gistools::utils::LogLevelFromString(config.logging.level, gistools::utils::LogLevel::kInfo);
    gistools::utils::Logger::Current().Configure(log_config);

    gistools::services::LayerRegistry layers;
    gistools::services::ConsoleMessageService messages;
    gistools::services::AppContext context{&layers, &messages, &layers};

    for (const auto& file : args.layer_files) {
        if (!layers.AddLayersFromFilename(file)) {
            std::cout << "Error: failed to load layer " << file << std::endl;
            return 1;
        }
    }

    gistools::tools::ToolRegistry registry(&context);
    RegisterDefaultTools(registry, config);

    const auto& command = args.positional[0];
    if (command == "list") {
        for (const auto& def : registry.GetDefinitions()) {
            std::cout << def.name << "\t" << def.description << std::endl;
        }
        return 0;
    }

    if (command == "describe") {
        if (args.positional.size() < 2) {
            PrintUsage();
            return 1;
        }
        const auto json = registry.DescribeJson(args.positional[1]);
        if (json.is_null()) {
            std::cout << "Error: Tool '" << args.positional[1] << "' not found" << std::endl;
            return 1;
        }
        std::cout << json.dump(2) << std::endl;
        return 0;
    }

    if (command == "run") {
        return RunTool(registry, layers, config, args.positional);
    }

    PrintUsage();
    return 1;
}
