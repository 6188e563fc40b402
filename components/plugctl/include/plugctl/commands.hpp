#pragma once

#include "plugctl/app_config.hpp"
#include "plugctl/target_resolver.hpp"

#include "device_store/cache_store.hpp"
#include "device_store/pairing_store.hpp"
#include "plug_discovery/discovery_service.hpp"
#include "plug_session/session_controller.hpp"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace plugctl {

struct DiscoverOptions {
    std::chrono::seconds timeout{30};
    bool noCache = false;
    std::chrono::seconds cacheTimeout{3600};
    bool cacheOnly = false;
};

/**
 * @class CommandRunner
 * @brief Implements each plugctl subcommand
 *
 * Every command prints its outcome to the output stream and returns the
 * process exit status: 0 on success, 1 on failure.
 */
class CommandRunner {
public:
    using NetworkScan = plug_discovery::DiscoveryService::NetworkScan;
    using SessionFactory =
        std::function<std::unique_ptr<plug_session::SessionController>(const DeviceTarget&)>;
    using NowFunction = std::function<device_store::Timestamp()>;

    struct Dependencies {
        std::shared_ptr<device_store::CacheStore> cacheStore;
        std::shared_ptr<device_store::PairingStore> pairingStore;
        NetworkScan scan;
        SessionFactory sessionFactory;
        NowFunction now;
    };

    /**
     * @brief Real store file, UDP discovery and TCP sessions
     */
    static Dependencies defaultDependencies(const AppConfig& config);

    CommandRunner(const AppConfig& config, Dependencies dependencies, std::ostream& out, std::istream& in);

    int discover(const DiscoverOptions& options);
    int turnOn(const TargetOptions& target);
    int turnOff(const TargetOptions& target);
    int status(const TargetOptions& target);
    int rename(const TargetOptions& target, const std::string& newName);

    /**
     * @brief Pair a device under an alias, discovering it first if it is not cached
     */
    int pair(const std::string& deviceId, const std::string& alias);
    int unpair(const std::string& alias, bool force);
    int listPaired(bool verbose);
    int clearCache(bool force);

    // Devices not seen for this long are listed as offline
    static constexpr device_store::Timestamp RECENTLY_SEEN_SECONDS = 3600;
    static constexpr std::chrono::seconds PAIR_DISCOVERY_TIMEOUT{10};

private:
    int setPower(const TargetOptions& target, plug_protocol::PowerCommand command);
    std::unique_ptr<plug_session::SessionController> openSession(const TargetOptions& target);
    plug_discovery::DiscoveryService makeDiscoveryService(bool useCache, std::chrono::seconds cacheMaxAge) const;
    device_store::PairingTable loadPairingOrEmpty() const;
    bool confirm(const std::string& warning);
    int fail(const std::string& message);

    AppConfig config_;
    Dependencies dependencies_;
    std::ostream& out_;
    std::istream& in_;
};

} // namespace plugctl
