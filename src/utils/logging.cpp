#include "logging.hpp"
#include "../config/Config.hpp"
#include <cstdlib>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    std::string resolveLevel(const LoggingConfig& config)
    {
        if (const char* level = std::getenv("RECOLLECT_LOG_LEVEL"))
            return level;
        if (!config.level.empty())
            return config.level;
        return "info";
    }

    std::string resolveFile(const LoggingConfig& config)
    {
        if (const char* file = std::getenv("RECOLLECT_LOG_FILE"))
            return file;
        return config.file;
    }
}

namespace Log
{
    void init(const LoggingConfig& config)
    {
        std::shared_ptr<spdlog::logger> logger;
        std::string file = resolveFile(config);

        // Drop a previous registration so init can be called again (tests, reload)
        spdlog::drop("recollect");

        if (file.empty())
            logger = spdlog::stdout_color_mt("recollect");
        else
            logger = spdlog::basic_logger_mt("recollect", file);

        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern(config.pattern.empty() ? "[%d:%m:%Y:%H:%M:%S.%e] [%l] %v" : config.pattern);

        spdlog::set_level(spdlog::level::from_str(resolveLevel(config)));
        spdlog::flush_on(spdlog::level::info);
    }

    void shutdown()
    {
        spdlog::shutdown();
    }
}
