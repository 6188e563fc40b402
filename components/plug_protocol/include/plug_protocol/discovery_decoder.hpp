#pragma once

#include "plug_protocol/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plug_protocol {

/**
 * @brief Decoder for the UDP broadcasts plugs send on port 10002
 *
 * A broadcast is accepted only if it is exactly 165 bytes, starts with the
 * magic bytes FE F0 and carries the power plug type code 01A8 at offset 74.
 * Anything else is silently rejected by returning std::nullopt.
 */
class DiscoveryDecoder {
public:
    static constexpr size_t PACKET_SIZE = 165;
    static constexpr uint8_t MAGIC_0 = 0xFE;
    static constexpr uint8_t MAGIC_1 = 0xF0;

    /**
     * @brief Decode a datagram into a device record
     * @param packet Raw datagram bytes
     * @return Decoded record, or std::nullopt if the datagram is not a plug broadcast
     */
    static std::optional<DeviceRecord> decode(const std::vector<uint8_t>& packet);
    static std::optional<DeviceRecord> decode(const uint8_t* data, size_t length);

    /**
     * @brief Quick structural check without full decoding
     */
    static bool isPowerPlugPacket(const uint8_t* data, size_t length);

private:
    // Byte offsets within the 165-byte broadcast
    static constexpr size_t DEVICE_ID_OFFSET = 18;
    static constexpr size_t DEVICE_ID_LENGTH = 3;
    static constexpr size_t DEVICE_KEY_OFFSET = 40;
    static constexpr size_t NAME_OFFSET = 42;
    static constexpr size_t NAME_LENGTH = 32;
    static constexpr size_t TYPE_OFFSET = 74;
    static constexpr size_t IP_OFFSET = 76;
    static constexpr size_t MAC_OFFSET = 80;
    static constexpr size_t MAC_LENGTH = 6;
    static constexpr size_t STATE_OFFSET = 133;
    static constexpr size_t POWER_OFFSET = 135;

    static std::string decodeName(const uint8_t* field, size_t length);
    static std::string formatIpAddress(const uint8_t* field);
    static std::string formatMacAddress(const uint8_t* field);
};

/**
 * @brief Convenience wrapper around DiscoveryDecoder::decode
 */
std::optional<DeviceRecord> decodeDiscoveryPacket(const std::vector<uint8_t>& packet);

/**
 * @brief Decode bytes as UTF-8, replacing each invalid sequence with U+FFFD
 */
std::string decodeUtf8Lossy(const uint8_t* data, size_t length);

} // namespace plug_protocol
