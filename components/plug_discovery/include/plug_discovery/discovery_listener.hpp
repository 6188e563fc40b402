#pragma once

#include "plug_discovery/device_registry.hpp"
#include "plug_discovery/types.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace plug_discovery {

/**
 * @class DiscoveryListener
 * @brief Collects plug broadcasts from the discovery UDP port
 *
 * The receive loop runs on a background thread driving the listener's own
 * io_context. Packets that decode to a power plug are added to the
 * registry; repeat sightings of a known id go to the sighting handler
 * instead. The listener can be started again after stop().
 */
class DiscoveryListener {
public:
    /**
     * @brief Configuration for the discovery listener
     */
    struct Config {
        std::string listenAddress = "0.0.0.0";
        uint16_t listenPort = 10002;  // 0 binds an ephemeral port
        size_t maxMessageSize = 1024;
        bool enableBroadcast = true;
    };

    // Invoked on the I/O thread for every sighting of an already known id
    using SightingHandler = std::function<void(const DeviceRecord&)>;

    explicit DiscoveryListener(const Config& config);
    DiscoveryListener(const Config& config, std::shared_ptr<DeviceRegistry> registry);
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Bind the socket and start the receive loop (non-blocking)
     *
     * @return VoidResult BIND_ERROR if the address cannot be bound
     */
    VoidResult start();

    /**
     * @brief Close the socket on the I/O thread and join it
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Port the socket is bound to, 0 when not running
     */
    uint16_t localPort() const;

    /**
     * @brief Collect devices for the given duration
     *
     * Starts the listener if needed and stops it again afterwards in that
     * case. The registry is cleared first so each call is its own window.
     * A receive error ends the window early; whatever was collected is
     * still returned. A listener whose loop ended on an error is started
     * afresh by the next call.
     */
    Result<std::vector<DeviceRecord>> listen(std::chrono::milliseconds duration);

    /**
     * @brief Set the handler for repeat sightings; call before start()
     */
    void setSightingHandler(SightingHandler handler);

    ListenerStatistics getStatistics() const;

    std::shared_ptr<DeviceRegistry> registry() const { return registry_; }

protected:
    /**
     * @brief Completion of one receive; re-arms the loop while running
     *
     * A socket error ends the loop and marks the listener as not running.
     */
    void handlePacket(const boost::system::error_code& error, std::size_t bytesReceived);

private:
    void startReceive();
    void notifyReceiveFailed();

    Config config_;
    std::shared_ptr<DeviceRegistry> registry_;
    SightingHandler sightingHandler_;

    boost::asio::io_context ioContext_;
    boost::asio::ip::udp::socket socket_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread ioThread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> localPort_{0};

    std::vector<uint8_t> receiveBuffer_;
    boost::asio::ip::udp::endpoint senderEndpoint_;

    // Set when the receive loop ends on a socket error
    std::mutex waitMutex_;
    std::condition_variable waitCondition_;
    bool receiveFailed_ = false;

    ListenerStatistics statistics_;
    mutable std::mutex statisticsMutex_;
};

} // namespace plug_discovery
