/**
 * @file app_config.cpp
 * @brief Implementation of the configuration loader
 */

#include "plugctl/app_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace plugctl {

AppConfig Config::loadAppConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    try {
        return parseAppConfig(json);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid configuration in " + filepath + ": " + e.what());
    }
}

AppConfig Config::parseAppConfig(const nlohmann::json& json) {
    AppConfig config;
    config.session = parseSessionConfig(json);
    config.discovery = parseDiscoveryConfig(json);
    config.store = parseStoreSettings(json);
    config.logging = parseLoggingSettings(json);
    return config;
}

plug_session::SessionController::Config Config::parseSessionConfig(const nlohmann::json& json) {
    plug_session::SessionController::Config config;

    if (json.contains("session")) {
        const auto& sessionJson = json["session"];

        if (sessionJson.contains("port")) {
            config.port = sessionJson["port"].get<uint16_t>();
        }

        if (sessionJson.contains("connectTimeoutMs")) {
            config.connectTimeout = std::chrono::milliseconds(sessionJson["connectTimeoutMs"].get<int64_t>());
        }

        if (sessionJson.contains("loginTimeoutMs")) {
            config.loginTimeout = std::chrono::milliseconds(sessionJson["loginTimeoutMs"].get<int64_t>());
        }

        if (sessionJson.contains("responseTimeoutMs")) {
            config.responseTimeout = std::chrono::milliseconds(sessionJson["responseTimeoutMs"].get<int64_t>());
        }

        if (sessionJson.contains("settleDelayMs")) {
            config.settleDelay = std::chrono::milliseconds(sessionJson["settleDelayMs"].get<int64_t>());
        }

        if (sessionJson.contains("retryDelayMs")) {
            config.retryDelay = std::chrono::milliseconds(sessionJson["retryDelayMs"].get<int64_t>());
        }
    }

    return config;
}

plug_discovery::DiscoveryListener::Config Config::parseDiscoveryConfig(const nlohmann::json& json) {
    plug_discovery::DiscoveryListener::Config config;

    if (json.contains("discovery")) {
        const auto& discoveryJson = json["discovery"];

        if (discoveryJson.contains("listenAddress")) {
            config.listenAddress = discoveryJson["listenAddress"].get<std::string>();
        }

        if (discoveryJson.contains("listenPort")) {
            config.listenPort = discoveryJson["listenPort"].get<uint16_t>();
        }

        if (discoveryJson.contains("maxMessageSize")) {
            config.maxMessageSize = discoveryJson["maxMessageSize"].get<size_t>();
        }
    }

    return config;
}

StoreSettings Config::parseStoreSettings(const nlohmann::json& json) {
    StoreSettings settings;

    if (json.contains("store")) {
        const auto& storeJson = json["store"];

        if (storeJson.contains("path")) {
            settings.path = storeJson["path"].get<std::string>();
        }

        if (storeJson.contains("cacheMaxAgeSeconds")) {
            settings.cacheMaxAge = std::chrono::seconds(storeJson["cacheMaxAgeSeconds"].get<int64_t>());
        }
    }

    return settings;
}

LoggingSettings Config::parseLoggingSettings(const nlohmann::json& json) {
    LoggingSettings settings;

    if (json.contains("logging")) {
        const auto& loggingJson = json["logging"];

        if (loggingJson.contains("file")) {
            settings.file = loggingJson["file"].get<std::string>();
        }
    }

    return settings;
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse configuration file " + filepath + ": " + e.what());
    }
}

} // namespace plugctl
