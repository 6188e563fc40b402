/**
 * @file app_config.hpp
 * @brief Configuration file support for the plugctl command line tool
 */

#pragma once

#include "plug_discovery/discovery_listener.hpp"
#include "plug_session/session_controller.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <string>

namespace plugctl {

/**
 * @brief Where the store file lives and how long cached devices stay fresh
 */
struct StoreSettings {
    std::string path;  // empty means beside the executable
    std::chrono::seconds cacheMaxAge{3600};
};

struct LoggingSettings {
    std::string file;  // empty means plugctl.log beside the executable
};

/**
 * @brief Everything plugctl can read from its configuration file
 */
struct AppConfig {
    plug_session::SessionController::Config session;
    plug_discovery::DiscoveryListener::Config discovery;
    StoreSettings store;
    LoggingSettings logging;
};

/**
 * @class Config
 * @brief Loads AppConfig from a JSON file
 *
 * Every key is optional; missing keys keep their defaults.
 */
class Config {
public:
    /**
     * @brief Load the configuration from a file
     *
     * @param filepath Path to the JSON file
     * @return AppConfig Parsed configuration
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static AppConfig loadAppConfig(const std::string& filepath);

    static AppConfig parseAppConfig(const nlohmann::json& json);
    static plug_session::SessionController::Config parseSessionConfig(const nlohmann::json& json);
    static plug_discovery::DiscoveryListener::Config parseDiscoveryConfig(const nlohmann::json& json);
    static StoreSettings parseStoreSettings(const nlohmann::json& json);
    static LoggingSettings parseLoggingSettings(const nlohmann::json& json);

private:
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace plugctl
