#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gistools::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

// Values below 1 keep |fallback|.
int PositiveOr(int value, int fallback, const std::string& key) {
    if (value >= 1) {
        return value;
    }
    utils::Logger::Current().Warn("config", "ignoring " + key + "=" + std::to_string(value) + ": must be at least 1");
    return fallback;
}

bool ParseBool(const std::string& value, bool fallback) {
    bool parsed = fallback;
    return utils::TryParseBool(value, parsed) ? parsed : fallback;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }

    if (data.contains("output") && data["output"].is_object()) {
        const auto& output = data["output"];
        if (output.contains("directory") && output["directory"].is_string()) {
            config.output.directory = output["directory"].get<std::string>();
        }
        if (output.contains("overwrite") && output["overwrite"].is_boolean()) {
            config.output.overwrite = output["overwrite"].get<bool>();
        }
        if (output.contains("addToMap") && output["addToMap"].is_boolean()) {
            config.output.add_to_map = output["addToMap"].get<bool>();
        }
        if (output.contains("memoryLayer") && output["memoryLayer"].is_boolean()) {
            config.output.memory_layer = output["memoryLayer"].get<bool>();
        }
    }

    if (data.contains("tools") && data["tools"].is_object()) {
        const auto& tools = data["tools"];
        if (tools.contains("randomPointsMax") && tools["randomPointsMax"].is_number_integer()) {
            config.tools.random_points_max = PositiveOr(
                tools["randomPointsMax"].get<int>(), config.tools.random_points_max, "tools.randomPointsMax");
        }
    }
}

void ApplyEnvironment(Config& config) {
    const auto level = GetEnvFallback("GISTOOLS_LOGGING__LEVEL", "GISTOOLS_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }

    const auto directory = GetEnvFallback("GISTOOLS_OUTPUT__DIRECTORY", "GISTOOLS_OUTPUT_DIRECTORY");
    if (!directory.empty()) {
        config.output.directory = directory;
    }

    const auto overwrite = GetEnvFallback("GISTOOLS_OUTPUT__OVERWRITE", "GISTOOLS_OUTPUT_OVERWRITE");
    if (!overwrite.empty()) {
        config.output.overwrite = ParseBool(overwrite, config.output.overwrite);
    }

    const auto add_to_map = GetEnvFallback("GISTOOLS_OUTPUT__ADD_TO_MAP", "GISTOOLS_OUTPUT_ADD_TO_MAP");
    if (!add_to_map.empty()) {
        config.output.add_to_map = ParseBool(add_to_map, config.output.add_to_map);
    }

    const auto memory_layer = GetEnvFallback("GISTOOLS_OUTPUT__MEMORY_LAYER", "GISTOOLS_OUTPUT_MEMORY_LAYER");
    if (!memory_layer.empty()) {
        config.output.memory_layer = ParseBool(memory_layer, config.output.memory_layer);
    }

    const auto random_points_max = GetEnvFallback(
        "GISTOOLS_TOOLS__RANDOM_POINTS_MAX",
        "GISTOOLS_RANDOM_POINTS_MAX");
    if (!random_points_max.empty()) {
        config.tools.random_points_max = PositiveOr(
            ParseInt(random_points_max, config.tools.random_points_max),
            config.tools.random_points_max,
            "GISTOOLS_TOOLS__RANDOM_POINTS_MAX");
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".gistools" / "config.json";
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Logger::Current().Warn("config", "ignoring malformed " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    return config;
}

}  // namespace gistools::config
