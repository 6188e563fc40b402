#include "plug_session/session_controller.hpp"

#include "plug_protocol/error.hpp"
#include "plug_protocol/hex.hpp"
#include "plug_protocol/packet_builder.hpp"
#include "plug_protocol/response_parser.hpp"

#include <spdlog/spdlog.h>

namespace plug_session {

using plug_protocol::PacketBuilder;
using plug_protocol::PacketType;
using plug_protocol::ResponseParser;

namespace {

// Closes the connection on every exit path of an operation
class ConnectionCloser {
public:
    explicit ConnectionCloser(IConnection& connection) : connection_(connection) {}
    ~ConnectionCloser() { connection_.close(); }

    ConnectionCloser(const ConnectionCloser&) = delete;
    ConnectionCloser& operator=(const ConnectionCloser&) = delete;

private:
    IConnection& connection_;
};

} // namespace

SessionController::SessionController(std::string ipAddress, DeviceId deviceId)
    : SessionController(std::move(ipAddress), std::move(deviceId), Config{})
{
}

SessionController::SessionController(std::string ipAddress, DeviceId deviceId, const Config& config)
    : SessionController(std::move(ipAddress),
                        std::move(deviceId),
                        config,
                        std::make_shared<TcpConnectionFactory>(),
                        std::make_shared<SystemClock>())
{
}

SessionController::SessionController(std::string ipAddress,
                                     DeviceId deviceId,
                                     const Config& config,
                                     std::shared_ptr<IConnectionFactory> connectionFactory,
                                     std::shared_ptr<IClock> clock)
    : ipAddress_(std::move(ipAddress))
    , deviceId_(std::move(deviceId))
    , config_(config)
    , connectionFactory_(std::move(connectionFactory))
    , clock_(std::move(clock))
{
}

VoidResult SessionController::turnOn() {
    spdlog::info("Turning device ON - IP: {}, Device ID: {}", ipAddress_, deviceId_);
    return setPowerState(PowerCommand::ON);
}

VoidResult SessionController::turnOff() {
    spdlog::info("Turning device OFF - IP: {}, Device ID: {}", ipAddress_, deviceId_);
    return setPowerState(PowerCommand::OFF);
}

VoidResult SessionController::setPowerState(PowerCommand command) {
    CommandVerifier verifier = makeVerifier();
    return setPowerState(command, verifier);
}

VoidResult SessionController::setPowerState(PowerCommand command, CommandVerifier& verifier) {
    VoidResult valid = validateDeviceId();
    if (!valid) {
        return valid;
    }

    return verifier.run(
        command,
        [this, command] { return sendControlCommand(command); },
        [this] { return getStatus(); });
}

CommandVerifier SessionController::makeVerifier() const {
    return CommandVerifier(CommandVerifier::Config{config_.settleDelay, config_.retryDelay}, clock_);
}

VoidResult SessionController::sendControlCommand(PowerCommand command) {
    VoidResult valid = validateDeviceId();
    if (!valid) {
        return valid;
    }

    spdlog::debug("Sending control command {} to device at {}:{}",
                  plug_protocol::toString(command), ipAddress_, config_.port);

    try {
        auto connection = connectionFactory_->createConnection();
        ConnectionCloser closer(*connection);

        VoidResult connected = openConnection(*connection);
        if (!connected) {
            return connected;
        }

        Result<SessionHandshake> handshake = login(*connection);
        if (!handshake) {
            return VoidResult::propagate(handshake);
        }

        const auto packet = PacketBuilder::create(PacketType::CONTROL)
            .setSessionId(handshake.value.sessionIdHex)
            .setTimestamp(PacketBuilder::formatTimestamp(clock_->nowSeconds()))
            .setDeviceId(deviceId_)
            .setCommand(command)
            .toBinary();

        VoidResult written = connection->write(packet, config_.responseTimeout);
        if (!written) {
            return written;
        }

        spdlog::debug("Control command {} sent successfully", plug_protocol::toString(command));
        return makeSuccessResult();
    } catch (const plug_protocol::ProtocolError& e) {
        return makeErrorResult(errorCodeFor(e), e.what());
    } catch (const std::exception& e) {
        return makeErrorResult(ErrorCode::INTERNAL_ERROR,
            std::string("Control command failed: ") + e.what());
    }
}

Result<DeviceStatus> SessionController::getStatus() {
    using StatusResult = Result<DeviceStatus>;

    VoidResult valid = validateDeviceId();
    if (!valid) {
        return StatusResult::propagate(valid);
    }

    spdlog::debug("Getting device status - IP: {}, Device ID: {}", ipAddress_, deviceId_);

    try {
        auto connection = connectionFactory_->createConnection();
        ConnectionCloser closer(*connection);

        VoidResult connected = openConnection(*connection);
        if (!connected) {
            return StatusResult::propagate(connected);
        }

        Result<SessionHandshake> handshake = login(*connection);
        if (!handshake) {
            return StatusResult::propagate(handshake);
        }
        spdlog::debug("Login successful, session_id: {}", handshake.value.sessionIdHex);

        const auto packet = PacketBuilder::create(PacketType::GET_STATE)
            .setSessionId(handshake.value.sessionIdHex)
            .setTimestamp(PacketBuilder::formatTimestamp(clock_->nowSeconds()))
            .setDeviceId(deviceId_)
            .toBinary();

        Result<std::vector<uint8_t>> reply = exchange(*connection, packet);
        if (!reply) {
            return StatusResult::propagate(reply);
        }

        const auto status = ResponseParser::parseStatus(reply.value);
        if (!status) {
            spdlog::error("Received short response ({} bytes), device may not exist or invalid device ID",
                          reply.value.size());
            return StatusResult::error(ErrorCode::NO_OR_INVALID_DEVICE,
                "Device did not respond or invalid device ID");
        }

        return StatusResult::ok(*status);
    } catch (const plug_protocol::ProtocolError& e) {
        return StatusResult::error(errorCodeFor(e), e.what());
    } catch (const std::exception& e) {
        return StatusResult::error(ErrorCode::INTERNAL_ERROR,
            std::string("Status request failed: ") + e.what());
    }
}

VoidResult SessionController::setDeviceName(const std::string& name) {
    VoidResult valid = validateDeviceId();
    if (!valid) {
        return valid;
    }

    try {
        // Rejects bad lengths before a connection is opened
        PacketBuilder builder = PacketBuilder::create(PacketType::RENAME);
        builder.setDeviceId(deviceId_).setDeviceName(name);

        auto connection = connectionFactory_->createConnection();
        ConnectionCloser closer(*connection);

        VoidResult connected = openConnection(*connection);
        if (!connected) {
            return connected;
        }

        Result<SessionHandshake> handshake = login(*connection);
        if (!handshake) {
            return VoidResult::propagate(handshake);
        }

        const auto packet = builder
            .setSessionId(handshake.value.sessionIdHex)
            .setTimestamp(PacketBuilder::formatTimestamp(clock_->nowSeconds()))
            .toBinary();

        Result<std::vector<uint8_t>> reply = exchange(*connection, packet);
        if (!reply) {
            return VoidResult::propagate(reply);
        }

        if (!ResponseParser::isRenameAcknowledged(reply.value)) {
            return makeErrorResult(ErrorCode::NO_RESPONSE,
                "Device did not respond to name change command");
        }

        // Give the device a moment to apply the new name
        clock_->sleepFor(config_.settleDelay);

        spdlog::info("Device {} renamed to '{}'", deviceId_, name);
        return makeSuccessResult();
    } catch (const plug_protocol::ProtocolError& e) {
        return makeErrorResult(errorCodeFor(e), e.what());
    } catch (const std::exception& e) {
        return makeErrorResult(ErrorCode::INTERNAL_ERROR,
            std::string("Rename failed: ") + e.what());
    }
}

VoidResult SessionController::openConnection(IConnection& connection) {
    spdlog::debug("Connecting to device at {}:{}", ipAddress_, config_.port);

    VoidResult connected = connection.connect(ipAddress_, config_.port, config_.connectTimeout);
    if (!connected) {
        spdlog::error("Failed to connect to {}:{}: {}", ipAddress_, config_.port, connected.errorMessage);
    }
    return connected;
}

Result<SessionHandshake> SessionController::login(IConnection& connection) {
    using LoginResult = Result<SessionHandshake>;

    SessionHandshake handshake;
    handshake.timestampHex = PacketBuilder::formatTimestamp(clock_->nowSeconds());

    const auto packet = PacketBuilder::create(PacketType::LOGIN)
        .setTimestamp(handshake.timestampHex)
        .toBinary();

    VoidResult written = connection.write(packet, config_.loginTimeout);
    if (!written) {
        return LoginResult::propagate(written);
    }

    Result<std::vector<uint8_t>> reply = connection.read(config_.receiveBufferSize, config_.loginTimeout);
    if (!reply) {
        spdlog::error("Login to {} failed: {}", ipAddress_, reply.errorMessage);
        return LoginResult::propagate(reply);
    }

    const auto sessionId = ResponseParser::parseSessionId(reply.value);
    if (!sessionId) {
        return LoginResult::error(ErrorCode::LOGIN_TOO_SHORT,
            "Login response too short (" + std::to_string(reply.value.size()) + " bytes)");
    }

    handshake.sessionIdHex = *sessionId;
    return LoginResult::ok(handshake);
}

Result<std::vector<uint8_t>> SessionController::exchange(IConnection& connection,
                                                         const std::vector<uint8_t>& packet) {
    VoidResult written = connection.write(packet, config_.responseTimeout);
    if (!written) {
        return Result<std::vector<uint8_t>>::propagate(written);
    }

    Result<std::vector<uint8_t>> reply = connection.read(config_.receiveBufferSize, config_.responseTimeout);
    if (reply) {
        spdlog::debug("Received {} bytes response", reply.value.size());
    }
    return reply;
}

VoidResult SessionController::validateDeviceId() const {
    if (deviceId_.size() != 6 || !plug_protocol::hex::isHex(deviceId_)) {
        return makeErrorResult(ErrorCode::INVALID_DEVICE_ID,
            plug_protocol::InvalidDeviceIdError(deviceId_).what());
    }
    return makeSuccessResult();
}

ErrorCode SessionController::errorCodeFor(const plug_protocol::ProtocolError& error) {
    if (dynamic_cast<const plug_protocol::InvalidNameLengthError*>(&error) != nullptr) {
        return ErrorCode::INVALID_NAME_LENGTH;
    }
    if (dynamic_cast<const plug_protocol::InvalidDeviceIdError*>(&error) != nullptr) {
        return ErrorCode::INVALID_DEVICE_ID;
    }
    return ErrorCode::INTERNAL_ERROR;
}

} // namespace plug_session
