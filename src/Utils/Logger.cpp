// src/Utils/Logger.cpp
#include <Zipkit/Utils/Logger.hpp>
#include <iostream> // For errors raised before any sink exists

namespace Zipkit {
namespace Utils {

    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;

    void Logger::Init(const LogSettings &settings) {
        try {
            s_GlobalSinks.clear();

            // Console output goes to stderr so stdout stays usable for listings
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(settings.consoleLevel);
            console_sink->set_pattern("%^[%H:%M:%S.%e] [%n] [%l] %v%$");
            s_GlobalSinks.push_back(console_sink);

            if (!settings.logDir.empty() && !settings.logFileName.empty()) {
                std::filesystem::create_directories(settings.logDir);
                std::filesystem::path logFilePath = settings.logDir / settings.logFileName;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath.string(), 1024 * 1024 * 5, 3);
                file_sink->set_level(settings.fileLevel);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                s_GlobalSinks.push_back(file_sink);
            }

            if (s_CoreLogger) {
                spdlog::drop(s_CoreLogger->name());
            }
            s_CoreLogger = std::make_shared<spdlog::logger>("Core", s_GlobalSinks.begin(), s_GlobalSinks.end());
            spdlog::register_logger(s_CoreLogger);
            s_CoreLogger->set_level(spdlog::level::trace);
            s_CoreLogger->flush_on(spdlog::level::warn);

            s_CoreLogger->trace("Logger initialized. Console level: {}, File level: {}",
                                spdlog::level::to_string_view(settings.consoleLevel),
                                spdlog::level::to_string_view(settings.fileLevel));

        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            UseFallback("Core_Fallback");
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory setup failed: " << ex.what() << std::endl;
            UseFallback("Core_FS_Fallback");
        }
    }

    // Console-only core logger; it is kept out of the registry so a repeated failure cannot collide on its name
    void Logger::UseFallback(const std::string &name) {
        if (s_CoreLogger) {
            spdlog::drop(s_CoreLogger->name());
        }
        s_GlobalSinks.clear();
        s_GlobalSinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        s_CoreLogger = std::make_shared<spdlog::logger>(name, s_GlobalSinks.begin(), s_GlobalSinks.end());
        s_CoreLogger->set_level(spdlog::level::err);
    }

    std::shared_ptr<spdlog::logger> &Logger::GetCoreLogger() {
        if (!s_CoreLogger) {
            LogSettings fallback;
            fallback.consoleLevel = spdlog::level::warn;
            Init(fallback);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string &name) {
        auto logger = spdlog::get(name);
        if (!logger) {
            if (s_GlobalSinks.empty()) {
                // Init() was never called: named loggers still need the console sink
                GetCoreLogger();
            }
            logger = std::make_shared<spdlog::logger>(name, s_GlobalSinks.begin(), s_GlobalSinks.end());
            logger->set_level(spdlog::level::trace); // sinks do the filtering
            logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(logger);
        }
        return logger;
    }

    void Logger::SetLevel(const std::string &loggerName, spdlog::level::level_enum level) {
        auto logger = spdlog::get(loggerName);
        if (logger) {
            logger->set_level(level);
        } else {
            GetCoreLogger()->warn("Attempted to set level for non-existent logger: {}", loggerName);
        }
    }

} // namespace Utils
} // namespace Zipkit
