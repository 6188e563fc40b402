#pragma once

#include "plug_protocol/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace plug_protocol {

/**
 * @brief Kinds of packet a client sends to a plug
 */
enum class PacketType {
    LOGIN,
    GET_STATE,
    CONTROL,
    RENAME
};

std::string toString(PacketType type);

/**
 * @brief Builder for the fixed-layout hex payloads sent over TCP
 *
 * Each packet type is a template with slots for the timestamp, the session
 * id issued at login, the device id and the command-specific field. Bytes
 * 2..4 of every template hold the signed packet length, little-endian.
 *
 * @code
 * auto bytes = PacketBuilder::create(PacketType::CONTROL)
 *                  .setSessionId(handshake.sessionIdHex)
 *                  .setTimestamp(handshake.timestampHex)
 *                  .setDeviceId("a1b2c3")
 *                  .setCommand(PowerCommand::ON)
 *                  .toBinary();
 * @endcode
 */
class PacketBuilder {
public:
    /// Hex characters in the rename name field (32 bytes)
    static constexpr size_t NAME_FIELD_HEX_LENGTH = 64;
    static constexpr size_t MIN_NAME_BYTES = 2;
    static constexpr size_t MAX_NAME_BYTES = 32;

    /**
     * @brief Create a builder for the specified packet type
     */
    static PacketBuilder create(PacketType type);

    /**
     * @brief Set the timestamp from 8 hex characters
     * @throws ValidationError if not 8 hex characters
     */
    PacketBuilder& setTimestamp(const std::string& timestampHex);

    /**
     * @brief Set the session id returned by login (8 hex characters)
     * @throws ValidationError if not 8 hex characters
     */
    PacketBuilder& setSessionId(const std::string& sessionIdHex);

    /**
     * @brief Set the target device id
     * @throws InvalidDeviceIdError unless exactly 6 hex characters
     */
    PacketBuilder& setDeviceId(const std::string& deviceId);

    PacketBuilder& setCommand(PowerCommand command);

    /**
     * @brief Set the new device name for a rename packet
     * @throws InvalidNameLengthError if outside 2..32 UTF-8 bytes
     */
    PacketBuilder& setDeviceName(const std::string& name);

    /**
     * @brief Build the unsigned payload
     * @throws ValidationError if a field the packet type needs is missing
     */
    std::string build() const;

    /**
     * @brief Build and append the two-stage signature
     */
    std::string buildSigned() const;

    /**
     * @brief Signed packet as wire bytes
     */
    std::vector<uint8_t> toBinary() const;

    PacketType getType() const { return type_; }

    /**
     * @brief Hex-encode a device name into the 64-character name field
     * @throws InvalidNameLengthError if outside 2..32 UTF-8 bytes
     */
    static std::string encodeDeviceName(const std::string& name);

    /**
     * @brief Render seconds since epoch as 8 lowercase hex digits
     */
    static std::string formatTimestamp(uint32_t secondsSinceEpoch);

private:
    explicit PacketBuilder(PacketType type);

    void require(const std::string& value, const char* field) const;

    PacketType type_;
    std::string timestampHex_;
    std::string sessionIdHex_;
    std::string deviceId_;
    std::string nameHex_;
    PowerCommand command_ = PowerCommand::OFF;
    bool commandSet_ = false;
};

} // namespace plug_protocol
