#pragma once

#include <EASTL/string.h>
#include <EASTL/vector.h>
#include <cstdint>

namespace ember {

struct LogConfig {
    eastl::string level = "info";
    eastl::vector<eastl::string> disabledModules;
    eastl::string filePath;  // Empty: console only
};

struct GraphConfig {
    static constexpr uint32_t kMaxResourceIds = 65536;

    uint32_t maxResourcesPerFrame = kMaxResourceIds;
    bool validateHandleGenerations = true;
    bool logFrameStatistics = false;
};

// Library settings, loaded from a JSON document:
//   { "logging": { "level": "debug", "disabledModules": ["Pipeline"], "file": "ember.log" },
//     "renderGraph": { "maxResourcesPerFrame": 4096, "validateHandleGenerations": true,
//                      "logFrameStatistics": false } }
struct EmberConfig {
    LogConfig log;
    GraphConfig graph;

    // Missing file or malformed JSON yields defaults (logged)
    static EmberConfig loadFromFile(const eastl::string& configPath);
    static EmberConfig parse(const eastl::string& jsonText);
};

} // namespace ember
