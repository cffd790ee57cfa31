// include/Zipkit/Utils/Logger.hpp
#ifndef ZIPKIT_LOGGER_HPP
#define ZIPKIT_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Zipkit::Utils {

    struct LogSettings {
        std::filesystem::path logDir;          // empty = no file sink
        std::string logFileName = "zipkit.log";
        spdlog::level::level_enum consoleLevel = spdlog::level::info;
        spdlog::level::level_enum fileLevel = spdlog::level::trace;
    };

    class Logger {
    public:
        // Call once at startup. Re-initializing replaces the shared sinks for loggers created afterwards.
        static void Init(const LogSettings &settings = LogSettings{});

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named loggers are created on first use with the sinks set up by Init().
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void SetLevel(const std::string &loggerName, spdlog::level::level_enum level);

    private:
        static void UseFallback(const std::string &name);

        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace Zipkit::Utils

#define ZIPKIT_LOG_TRACE(...)    if(auto& logger = ::Zipkit::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define ZIPKIT_LOG_INFO(...)     if(auto& logger = ::Zipkit::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define ZIPKIT_LOG_WARN(...)     if(auto& logger = ::Zipkit::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define ZIPKIT_LOG_ERROR(...)    if(auto& logger = ::Zipkit::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define ZIPKIT_LOG_CRITICAL(...) if(auto& logger = ::Zipkit::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // ZIPKIT_LOGGER_HPP
