#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    // Until init() runs (config not read yet), only warnings and errors, on stderr
    inline void bootstrap()
    {
        auto console = spdlog::stderr_color_mt("bootstrap");
        spdlog::set_default_logger(console);
        spdlog::set_level(spdlog::level::warn);
    }

    inline void init(const std::string& path = "forgetmenot.log", const std::string& level = "info")
    {
        // File logger, made the default so every component logs through spdlog::*
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // from_str maps unknown names to "off"; keep info in that case
        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off")
            lvl = spdlog::level::info;
        spdlog::set_level(lvl);
        spdlog::flush_on(spdlog::level::info);
    }
}
