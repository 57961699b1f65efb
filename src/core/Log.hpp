#pragma once

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <EASTL/string.h>
#include <EASTL/unordered_set.h>
#include <EASTL/vector.h>
#include <memory>
#include <vector>
#include <format>

namespace ember {

struct LogConfig;

class Log {
public:
    static void init();
    static void shutdown();

    static auto getLogger() -> std::shared_ptr<spdlog::logger>& { ensureLogger(); return s_logger; }

    // Modular logging methods
    template <typename... Args>
    static void trace(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::trace, module, fmt, args...);
    }

    template <typename... Args>
    static void debug(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::debug, module, fmt, args...);
    }

    template <typename... Args>
    static void info(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::info, module, fmt, args...);
    }

    template <typename... Args>
    static void warn(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::warn, module, fmt, args...);
    }

    template <typename... Args>
    static void error(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::err, module, fmt, args...);
    }

    template <typename... Args>
    static void critical(const eastl::string& module, const eastl::string& fmt, Args&&... args) {
        write(spdlog::level::critical, module, fmt, args...);
    }

    // Module filtering configuration
    static void setModuleEnabled(const eastl::string& module, bool enabled);
    static void setGlobalLevel(spdlog::level::level_enum level);
    static bool isModuleEnabled(const eastl::string& module);

    // Apply the "logging" section of an EmberConfig
    static void configure(const LogConfig& config);
    static bool parseLevel(const eastl::string& name, spdlog::level::level_enum& outLevel);

private:
    template <typename... Args>
    static void write(spdlog::level::level_enum level, const eastl::string& module, const eastl::string& fmt, Args&... args) {
        ensureLogger();
        if (!s_logger->should_log(level) || !isModuleEnabled(module)) {
            return;
        }
        s_logger->log(level, "[{}] {}", module.c_str(), std::vformat(fmt.c_str(), std::make_format_args(args...)));
    }

    static void ensureLogger();
    static void addFileSink(const eastl::string& path);
    static void loadConfigFromEnvironment();

    static inline std::shared_ptr<spdlog::logger> s_logger;
    static inline eastl::unordered_set<eastl::string> s_disabledModules;
};

} // namespace ember
