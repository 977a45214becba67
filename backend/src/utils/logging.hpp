#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& level = "info", const std::string& filename = "revisio.log")
    {
        // File logger so the interactive session on stdout stays clean
        auto file_logger = spdlog::basic_logger_mt("file_logger", filename);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Unknown names map to off
        spdlog::set_level(spdlog::level::from_str(level));
        spdlog::flush_on(spdlog::level::info);
    }
}
