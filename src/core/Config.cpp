#include "Config.hpp"
#include "Log.hpp"

#define JSON_HAS_CPP_17
#include <nlohmann/json.hpp>

#include <fstream>

namespace ember {

namespace {

void readLogging(const nlohmann::json& loggingConfig, LogConfig& log) {
    if (loggingConfig.contains("level")) {
        log.level = loggingConfig["level"].get<std::string>().c_str();
    }

    if (loggingConfig.contains("disabledModules")) {
        for (const auto& module : loggingConfig["disabledModules"]) {
            log.disabledModules.push_back(module.get<std::string>().c_str());
        }
    }

    if (loggingConfig.contains("file")) {
        log.filePath = loggingConfig["file"].get<std::string>().c_str();
    }
}

void readRenderGraph(const nlohmann::json& graphConfig, GraphConfig& graph) {
    if (graphConfig.contains("maxResourcesPerFrame")) {
        int64_t requested = graphConfig["maxResourcesPerFrame"].get<int64_t>();
        int64_t clamped = requested;
        if (clamped < 1) {
            clamped = 1;
        } else if (clamped > GraphConfig::kMaxResourceIds) {
            clamped = GraphConfig::kMaxResourceIds;
        }

        if (clamped != requested) {
            Log::warn("Config", "maxResourcesPerFrame {} out of range, clamping to {}", requested, clamped);
        }
        graph.maxResourcesPerFrame = static_cast<uint32_t>(clamped);
    }

    if (graphConfig.contains("validateHandleGenerations")) {
        graph.validateHandleGenerations = graphConfig["validateHandleGenerations"].get<bool>();
    }

    if (graphConfig.contains("logFrameStatistics")) {
        graph.logFrameStatistics = graphConfig["logFrameStatistics"].get<bool>();
    }
}

EmberConfig fromJson(const nlohmann::json& config) {
    EmberConfig settings;

    if (config.contains("logging")) {
        readLogging(config["logging"], settings.log);
    }

    if (config.contains("renderGraph")) {
        readRenderGraph(config["renderGraph"], settings.graph);
    }

    return settings;
}

} // namespace

EmberConfig EmberConfig::loadFromFile(const eastl::string& configPath) {
    try {
        std::ifstream configFile(configPath.c_str());
        if (!configFile.is_open()) {
            Log::warn("Config", "Config file not found: {}, using defaults", configPath.c_str());
            return EmberConfig{};
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        EmberConfig settings = fromJson(config);

        Log::info("Config", "Loaded config from {}: logLevel={}, maxResourcesPerFrame={}, validateHandleGenerations={}",
                  configPath.c_str(),
                  settings.log.level.c_str(),
                  settings.graph.maxResourcesPerFrame,
                  settings.graph.validateHandleGenerations ? "on" : "off");
        return settings;
    } catch (const nlohmann::json::exception& e) {
        Log::error("Config", "Failed to parse config file {}: {}", configPath.c_str(), e.what());
    } catch (const std::exception& e) {
        Log::error("Config", "Failed to load config file {}: {}", configPath.c_str(), e.what());
    }

    return EmberConfig{};
}

EmberConfig EmberConfig::parse(const eastl::string& jsonText) {
    try {
        return fromJson(nlohmann::json::parse(jsonText.c_str()));
    } catch (const nlohmann::json::exception& e) {
        Log::error("Config", "Failed to parse config: {}", e.what());
    }

    return EmberConfig{};
}

} // namespace ember
