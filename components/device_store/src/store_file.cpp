// components/device_store/src/store_file.cpp
#include "device_store/store_file.hpp"
#include "device_store/error.hpp"
#include "device_store/json_codec.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

namespace device_store {

StoreFile::StoreFile(std::filesystem::path path)
    : path_(std::move(path))
{
}

StoreDocument StoreFile::load() const {
    spdlog::debug("Loading store from: {}", path_.string());

    if (!exists()) {
        spdlog::debug("Store file does not exist, starting with an empty store");
        return StoreDocument{};
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw StoreError("Failed to open " + path_.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    StoreDocument document;
    try {
        const nlohmann::json json = nlohmann::json::parse(buffer.str());

        document.version = json.at("version").get<std::string>();
        if (document.version != STORE_VERSION) {
            spdlog::warn("Store version mismatch (found: {}, expected: {}), starting fresh",
                         document.version, STORE_VERSION);
            return StoreDocument{};
        }

        if (json.contains("cache") && !json["cache"].is_null()) {
            document.cache = JsonCodec::deviceCacheFromJson(json["cache"]);
        }
        if (json.contains("pairing") && !json["pairing"].is_null()) {
            document.pairing = JsonCodec::pairingTableFromJson(json["pairing"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Failed to parse " + path_.string() + ": " + e.what());
    }

    spdlog::debug("Loaded store with version: {}", document.version);
    return document;
}

void StoreFile::save(const StoreDocument& document) const {
    spdlog::debug("Saving store to: {}", path_.string());

    nlohmann::json json;
    json["version"] = document.version;
    json["cache"] = document.cache ? JsonCodec::toJson(*document.cache) : nlohmann::json(nullptr);
    json["pairing"] = document.pairing ? JsonCodec::toJson(*document.pairing) : nlohmann::json(nullptr);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StoreError("Failed to create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        throw StoreError("Failed to open " + path_.string() + " for writing");
    }

    file << json.dump(2);
    if (!file) {
        throw StoreError("Failed to write " + path_.string());
    }

    spdlog::debug("Saved store");
}

void StoreFile::clear() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        throw StoreError("Failed to remove " + path_.string() + ": " + ec.message());
    }
}

bool StoreFile::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::filesystem::path StoreFile::defaultPath() {
    std::error_code ec;
    const auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || !exePath.has_parent_path()) {
        spdlog::warn("Could not determine executable directory, using the working directory");
        return std::filesystem::current_path() / DEFAULT_STORE_FILE_NAME;
    }
    return exePath.parent_path() / DEFAULT_STORE_FILE_NAME;
}

} // namespace device_store
