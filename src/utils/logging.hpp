#pragma once
#include <string>
#include <spdlog/spdlog.h>

struct LoggingConfig;

namespace Log
{
    // Installs the default logger. An empty file path logs to stdout.
    // RECOLLECT_LOG_LEVEL / RECOLLECT_LOG_FILE override the config.
    void init(const LoggingConfig& config);

    void shutdown();
}
