#pragma once

#include <string>

namespace plugctl {

struct LoggingOptions {
    bool verbose = false;
    bool debug = false;
    std::string logFile;  // empty means plugctl.log beside the executable
};

/**
 * @brief Install the default logger: colored console plus a daily log file
 *
 * Level is warn by default, info with verbose and debug with debug.
 * SPDLOG_LEVEL in the environment overrides it.
 */
void setupLogging(const LoggingOptions& options);

std::string defaultLogFile();

} // namespace plugctl
