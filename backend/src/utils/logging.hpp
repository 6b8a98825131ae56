#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace Log
{
    // stdout carries command output, so nothing may log there.
    inline void init(const std::string& logFile, spdlog::level::level_enum level)
    {
        std::shared_ptr<spdlog::logger> logger;
        try {
            logger = spdlog::basic_logger_mt("file_logger", logFile);
        }
        catch (const spdlog::spdlog_ex& ex) {
            logger = spdlog::get("stderr_logger");
            if (!logger) logger = spdlog::stderr_logger_mt("stderr_logger");
            spdlog::set_default_logger(logger);
            spdlog::set_level(spdlog::level::warn);
            spdlog::warn("Could not open log file '{}': {}", logFile, ex.what());
            return;
        }

        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }

    // Used before the config directory is known to exist.
    inline void initStderr()
    {
        auto logger = spdlog::get("stderr_logger");
        if (!logger) logger = spdlog::stderr_logger_mt("stderr_logger");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%l] %v");
        spdlog::set_level(spdlog::level::warn);
    }

    // True while log lines would land on stderr next to the user-facing error.
    inline bool writesToStderr()
    {
        auto logger = spdlog::default_logger();
        return logger && logger->name() == "stderr_logger";
    }
}
