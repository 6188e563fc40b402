#include "plug_discovery/discovery_listener.hpp"

#include "plug_protocol/discovery_decoder.hpp"

#include <spdlog/spdlog.h>

namespace plug_discovery {

DiscoveryListener::DiscoveryListener(const Config& config)
    : DiscoveryListener(config, std::make_shared<DeviceRegistry>())
{
}

DiscoveryListener::DiscoveryListener(const Config& config, std::shared_ptr<DeviceRegistry> registry)
    : config_(config)
    , registry_(std::move(registry))
    , socket_(ioContext_)
    , receiveBuffer_(config.maxMessageSize)
{
}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

VoidResult DiscoveryListener::start() {
    if (running_) {
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT, "Discovery listener is already running");
    }

    // A receive loop that ended on a socket error still owns the I/O thread
    if (ioThread_.joinable()) {
        stop();
    }

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(config_.listenAddress, ec);
    if (ec) {
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT,
                               "Invalid listen address '" + config_.listenAddress + "': " + ec.message());
    }
    const boost::asio::ip::udp::endpoint endpoint(address, config_.listenPort);

    ioContext_.restart();

    socket_.open(endpoint.protocol(), ec);
    if (!ec) {
        socket_.set_option(boost::asio::ip::udp::socket::reuse_address(true), ec);
    }
    if (!ec && config_.enableBroadcast) {
        socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    }
    if (!ec) {
        socket_.bind(endpoint, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        spdlog::error("Failed to bind discovery socket on {}:{}: {}",
                      config_.listenAddress, config_.listenPort, ec.message());
        return makeErrorResult(ErrorCode::BIND_ERROR,
                               "Failed to bind UDP socket on port " + std::to_string(config_.listenPort) +
                               ": " + ec.message());
    }

    localPort_ = socket_.local_endpoint(ec).port();

    {
        std::lock_guard<std::mutex> lock(statisticsMutex_);
        statistics_ = ListenerStatistics{};
    }
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        receiveFailed_ = false;
    }

    workGuard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(ioContext_));

    running_ = true;
    startReceive();

    ioThread_ = std::thread([this] {
        ioContext_.run();
    });

    spdlog::info("Listening for device broadcasts on UDP port {}", localPort_.load());
    return makeSuccessResult();
}

void DiscoveryListener::stop() {
    running_ = false;
    if (!ioThread_.joinable()) {
        return;
    }

    // The socket belongs to the I/O thread, so it is closed there
    boost::asio::post(ioContext_, [this] {
        boost::system::error_code ec;
        socket_.close(ec);
    });
    workGuard_.reset();

    if (ioThread_.joinable()) {
        ioThread_.join();
    }

    localPort_ = 0;
    spdlog::debug("Discovery listener stopped");
}

bool DiscoveryListener::isRunning() const {
    return running_;
}

uint16_t DiscoveryListener::localPort() const {
    return localPort_;
}

Result<std::vector<DeviceRecord>> DiscoveryListener::listen(std::chrono::milliseconds duration) {
    registry_->clear();
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        receiveFailed_ = false;
    }

    bool startedHere = false;
    if (!running_) {
        auto startResult = start();
        if (!startResult) {
            return Result<std::vector<DeviceRecord>>::propagate(startResult);
        }
        startedHere = true;
    }

    spdlog::info("Discovering devices for {} ms", duration.count());

    {
        std::unique_lock<std::mutex> lock(waitMutex_);
        if (waitCondition_.wait_for(lock, duration, [this] { return receiveFailed_; })) {
            spdlog::warn("Discovery ended early after a socket error");
        }
    }

    auto records = registry_->snapshot();

    if (startedHere) {
        stop();
    }

    spdlog::info("Discovery completed, found {} devices", records.size());
    return Result<std::vector<DeviceRecord>>::ok(records);
}

void DiscoveryListener::setSightingHandler(SightingHandler handler) {
    sightingHandler_ = std::move(handler);
}

ListenerStatistics DiscoveryListener::getStatistics() const {
    std::lock_guard<std::mutex> lock(statisticsMutex_);
    return statistics_;
}

void DiscoveryListener::startReceive() {
    socket_.async_receive_from(
        boost::asio::buffer(receiveBuffer_),
        senderEndpoint_,
        [this](const boost::system::error_code& error, std::size_t bytesReceived) {
            handlePacket(error, bytesReceived);
        }
    );
}

void DiscoveryListener::handlePacket(const boost::system::error_code& error, std::size_t bytesReceived) {
    if (error == boost::asio::error::operation_aborted) {
        return;
    }

    if (error) {
        spdlog::error("Discovery socket error: {}", error.message());
        running_ = false;
        notifyReceiveFailed();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statisticsMutex_);
        statistics_.packetsReceived++;
        statistics_.bytesReceived += bytesReceived;
    }

    auto record = plug_protocol::DiscoveryDecoder::decode(receiveBuffer_.data(), bytesReceived);
    if (!record) {
        spdlog::debug("Ignoring {} byte packet from {}", bytesReceived,
                      senderEndpoint_.address().to_string());
        std::lock_guard<std::mutex> lock(statisticsMutex_);
        statistics_.packetsIgnored++;
    } else if (registry_->insertIfAbsent(*record)) {
        spdlog::info("Found device: {} ({}) at {}", record->name, record->deviceId, record->ipAddress);
        std::lock_guard<std::mutex> lock(statisticsMutex_);
        statistics_.devicesDiscovered++;
    } else {
        {
            std::lock_guard<std::mutex> lock(statisticsMutex_);
            statistics_.duplicateSightings++;
        }
        if (sightingHandler_) {
            try {
                sightingHandler_(*record);
            } catch (const std::exception& e) {
                spdlog::error("Sighting handler failed for device {}: {}", record->deviceId, e.what());
            }
        }
    }

    if (running_) {
        startReceive();
    }
}

void DiscoveryListener::notifyReceiveFailed() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        receiveFailed_ = true;
    }
    waitCondition_.notify_all();
}

} // namespace plug_discovery
