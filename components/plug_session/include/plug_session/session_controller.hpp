#pragma once

#include "plug_session/clock.hpp"
#include "plug_session/command_verifier.hpp"
#include "plug_session/connection.hpp"
#include "plug_session/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace plug_protocol { class ProtocolError; }

namespace plug_session {

using plug_protocol::SessionHandshake;

/**
 * @class SessionController
 * @brief Runs login-then-command exchanges against one plug
 *
 * Every public operation opens its own TCP connection, logs in, sends one
 * signed packet, optionally reads one reply and closes the connection.
 * Controllers share no state, so several may run in parallel against
 * different plugs. A controller keeps nothing per call either; each
 * setPowerState builds its own verifier.
 */
class SessionController {
public:
    /**
     * @brief Session timing and transport settings
     */
    struct Config {
        uint16_t port = 9957;
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::milliseconds loginTimeout{3000};
        std::chrono::milliseconds responseTimeout{5000};
        std::chrono::milliseconds settleDelay{500};
        std::chrono::milliseconds retryDelay{1000};
        size_t receiveBufferSize = 1024;
    };

    /**
     * @brief Construct a controller using real TCP and the system clock
     *
     * @param ipAddress Address of the plug
     * @param deviceId 6 hex character device id
     * @param config Session configuration
     */
    SessionController(std::string ipAddress, DeviceId deviceId);
    SessionController(std::string ipAddress, DeviceId deviceId, const Config& config);

    /**
     * @brief Construct a controller with custom transport and clock
     */
    SessionController(std::string ipAddress,
                      DeviceId deviceId,
                      const Config& config,
                      std::shared_ptr<IConnectionFactory> connectionFactory,
                      std::shared_ptr<IClock> clock);

    /**
     * @brief Switch the plug on and confirm it with up to two status polls
     * @return COMMAND_NOT_CONFIRMED if the plug never reported ON
     */
    VoidResult turnOn();

    /**
     * @brief Switch the plug off and confirm it with up to two status polls
     * @return COMMAND_NOT_CONFIRMED if the plug never reported OFF
     */
    VoidResult turnOff();

    /**
     * @brief Composite send-and-verify used by turnOn and turnOff
     */
    VoidResult setPowerState(PowerCommand command);

    /**
     * @brief Same as setPowerState(command), driven through the given verifier
     *
     * The verifier keeps the poll count and state trace of this call.
     */
    VoidResult setPowerState(PowerCommand command, CommandVerifier& verifier);

    /**
     * @brief Verifier using this controller's delays and clock
     */
    CommandVerifier makeVerifier() const;

    /**
     * @brief Send a control packet without verifying the result
     *
     * The plug sends no reply to a control packet, so success only means the
     * packet was written after a successful login.
     */
    VoidResult sendControlCommand(PowerCommand command);

    /**
     * @brief Read the current state and power draw
     * @return NO_OR_INVALID_DEVICE if the reply is shorter than 50 bytes
     */
    Result<DeviceStatus> getStatus();

    /**
     * @brief Change the name the plug advertises in its broadcasts
     * @param name New name, 2 to 32 UTF-8 bytes
     * @return INVALID_NAME_LENGTH before any I/O if the name is out of range,
     *         NO_RESPONSE if the reply is shorter than 20 bytes
     */
    VoidResult setDeviceName(const std::string& name);

    const std::string& getIpAddress() const { return ipAddress_; }
    const DeviceId& getDeviceId() const { return deviceId_; }
    const Config& getConfig() const { return config_; }

private:
    VoidResult openConnection(IConnection& connection);
    Result<SessionHandshake> login(IConnection& connection);
    Result<std::vector<uint8_t>> exchange(IConnection& connection,
                                          const std::vector<uint8_t>& packet);

    VoidResult validateDeviceId() const;
    static ErrorCode errorCodeFor(const plug_protocol::ProtocolError& error);

    std::string ipAddress_;
    DeviceId deviceId_;
    Config config_;
    std::shared_ptr<IConnectionFactory> connectionFactory_;
    std::shared_ptr<IClock> clock_;
};

} // namespace plug_session
