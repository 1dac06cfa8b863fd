#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Utils/Result.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

struct LoggerConfig {
    std::string name = "qemuhive";
    std::string filePath = "logs/qemuhive.log";
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::trace;
    std::size_t rotationSize = 1024 * 1024 * 5; // 5 MB
    std::size_t maxFiles = 3;
    bool enableFile = true;

    // spdlog maps names it does not know to off, so only a literal "off" may yield it.
    static Result<spdlog::level::level_enum> parseLevel(const std::string& name) {
        const auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return Result<spdlog::level::level_enum>::fail("unknown log level '" + name + "'");
        }
        return level;
    }
};

class SafeLogger {
    static inline std::shared_ptr<spdlog::logger> instance;
    static inline std::mutex mtx;

public:
    // Only the first call configures the sinks; later calls are ignored.
    static void initialize(const LoggerConfig& config = LoggerConfig()) {
        std::lock_guard lock(mtx);
        if (instance) return;

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(config.consoleLevel);
        sinks.push_back(console);

        if (config.enableFile) {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.rotationSize, config.maxFiles);
            file->set_level(config.fileLevel);
            sinks.push_back(file);
        }

        instance = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        instance->set_level(spdlog::level::trace);
        instance->flush_on(spdlog::level::info);
        spdlog::set_default_logger(instance);
    }

    static std::shared_ptr<spdlog::logger>& get() {
        if (!instance) initialize();
        return instance;
    }
};

#define QHLOG_TRACE(...)    SafeLogger::get()->trace(__VA_ARGS__)
#define QHLOG_DEBUG(...)    SafeLogger::get()->debug(__VA_ARGS__)
#define QHLOG_INFO(...)     SafeLogger::get()->info(__VA_ARGS__)
#define QHLOG_WARN(...)     SafeLogger::get()->warn(__VA_ARGS__)
#define QHLOG_ERROR(...)    SafeLogger::get()->error(__VA_ARGS__)
#define QHLOG_CRITICAL(...) SafeLogger::get()->critical(__VA_ARGS__)
