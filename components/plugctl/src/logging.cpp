#include "plugctl/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace plugctl {

void setupLogging(const LoggingOptions& options) {
    spdlog::level::level_enum level = spdlog::level::warn;
    if (options.debug) {
        level = spdlog::level::debug;
    } else if (options.verbose) {
        level = spdlog::level::info;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("%^[%l]%$ %v");

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    const std::string logFile = options.logFile.empty() ? defaultLogFile() : options.logFile;
    try {
        auto fileSink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(logFile, 0, 0);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v");
        sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: file logging disabled: " << e.what() << std::endl;
    }

    auto logger = std::make_shared<spdlog::logger>("plugctl", sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::set_default_logger(logger);

    spdlog::cfg::load_env_levels();
}

std::string defaultLogFile() {
    std::error_code ec;
    const auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || !exePath.has_parent_path()) {
        return "plugctl.log";
    }
    return (exePath.parent_path() / "plugctl.log").string();
}

} // namespace plugctl
