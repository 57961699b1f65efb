#include "Log.hpp"
#include "Config.hpp"
#include <cstdlib>

namespace ember {

namespace {
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [thread %t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v";
}

void Log::init() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern(kConsolePattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (s_logger) {
        spdlog::drop(s_logger->name());
    }
    s_logger = std::make_shared<spdlog::logger>("EMBER", sinks.begin(), sinks.end());
    s_logger->set_level(spdlog::level::trace);
    s_logger->flush_on(spdlog::level::err);

    spdlog::register_logger(s_logger);

    // Load configuration from environment
    loadConfigFromEnvironment();
}

void Log::shutdown() {
    if (s_logger) {
        s_logger->flush();
        spdlog::drop(s_logger->name());
        s_logger.reset();
    }
    s_disabledModules.clear();
}

void Log::ensureLogger() {
    if (!s_logger) {
        init();
    }
}

void Log::addFileSink(const eastl::string& path) {
    // Rotating file sink: max 5MB per file, keep 3 files
    constexpr size_t max_file_size = 1024 * 1024 * 5;
    constexpr size_t max_files = 3;
    try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.c_str(), max_file_size, max_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern(kFilePattern);
        s_logger->sinks().push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
        s_logger->warn("[Log] Cannot open log file {}: {}", path.c_str(), e.what());
    }
}

void Log::setModuleEnabled(const eastl::string& module, bool enabled) {
    if (enabled) {
        s_disabledModules.erase(module);
    } else {
        s_disabledModules.insert(module);
    }
}

void Log::setGlobalLevel(spdlog::level::level_enum level) {
    if (s_logger) {
        s_logger->set_level(level);
    }
}

bool Log::isModuleEnabled(const eastl::string& module) {
    return s_disabledModules.find(module) == s_disabledModules.end();
}

bool Log::parseLevel(const eastl::string& level, spdlog::level::level_enum& outLevel) {
    if (level == "trace") {
        outLevel = spdlog::level::trace;
    } else if (level == "debug") {
        outLevel = spdlog::level::debug;
    } else if (level == "info") {
        outLevel = spdlog::level::info;
    } else if (level == "warn") {
        outLevel = spdlog::level::warn;
    } else if (level == "error") {
        outLevel = spdlog::level::err;
    } else if (level == "critical") {
        outLevel = spdlog::level::critical;
    } else if (level == "off") {
        outLevel = spdlog::level::off;
    } else {
        return false;
    }
    return true;
}

void Log::configure(const LogConfig& config) {
    ensureLogger();

    spdlog::level::level_enum level = spdlog::level::info;
    if (parseLevel(config.level, level)) {
        setGlobalLevel(level);
    } else {
        warn("Config", "Unknown log level '{}', keeping current level", config.level.c_str());
    }

    for (const auto& module : config.disabledModules) {
        setModuleEnabled(module, false);
    }

    if (!config.filePath.empty()) {
        addFileSink(config.filePath);
    }
}

void Log::loadConfigFromEnvironment() {
    const char* disabledModulesEnv = std::getenv("EMBER_LOG_DISABLED_MODULES");
    if (disabledModulesEnv) {
        eastl::string modules(disabledModulesEnv);

        size_t start = 0;
        size_t end = 0;
        while ((end = modules.find(',', start)) != eastl::string::npos) {
            eastl::string module = modules.substr(start, end - start);
            if (!module.empty()) {
                s_disabledModules.insert(module);
            }
            start = end + 1;
        }

        eastl::string lastModule = modules.substr(start);
        if (!lastModule.empty()) {
            s_disabledModules.insert(lastModule);
        }
    }

    const char* fileEnv = std::getenv("EMBER_LOG_FILE");
    if (fileEnv && *fileEnv) {
        addFileSink(fileEnv);
    }

    // Check EMBER_DEBUG first - if set to 1, enable debug logging
    const char* debugEnv = std::getenv("EMBER_DEBUG");
    bool debugMode = debugEnv && (eastl::string(debugEnv) == "1");

    spdlog::level::level_enum level = debugMode ? spdlog::level::debug : spdlog::level::info;

    // EMBER_LOG_LEVEL takes priority if explicitly set
    const char* logLevelEnv = std::getenv("EMBER_LOG_LEVEL");
    if (logLevelEnv) {
        parseLevel(logLevelEnv, level);
    }
    setGlobalLevel(level);
}

} // namespace ember
