/**
 * @file signer.hpp
 * @brief CRC-16 checksum and the two-stage packet signature
 *
 * Every packet sent to a plug carries two 16-bit checksums: one over the
 * payload and one over a key buffer derived from the first. The plug
 * silently drops packets whose suffix does not match.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace plug_protocol {

/**
 * @brief CRC-16 with polynomial 0x1021, no reflection, no final XOR
 *
 * The plug firmware seeds the register with the polynomial itself rather
 * than the XMODEM default of zero.
 */
class Crc16 {
public:
    static constexpr uint16_t POLYNOMIAL = 0x1021;
    static constexpr uint16_t DEVICE_SEED = 0x1021;

    explicit Crc16(uint16_t seed = DEVICE_SEED) : register_(seed) {}

    void update(const uint8_t* data, size_t length);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    uint16_t finalize() const { return register_; }

    static uint16_t compute(const std::vector<uint8_t>& data, uint16_t seed = DEVICE_SEED);

private:
    uint16_t register_;
};

/**
 * @brief Produces the signed form of hex payloads
 */
class PacketSigner {
public:
    /// Count of ASCII '0' bytes appended to the packet CRC in the key buffer
    static constexpr size_t KEY_PADDING_BYTES = 32;

    /// Hex characters appended by sign()
    static constexpr size_t SIGNATURE_HEX_LENGTH = 8;

    /**
     * @brief Render a checksum as 4 hex characters, low byte first
     */
    static std::string swappedHex(uint16_t crc);

    /**
     * @brief Signature segment for the payload bytes
     */
    static std::string packetCrcSegment(const std::vector<uint8_t>& payload);

    /**
     * @brief Signature segment for the key buffer built from a packet CRC segment
     */
    static std::string keyCrcSegment(const std::string& packetCrcSegment);

    /**
     * @brief Append both signature segments to a hex payload
     * @param payloadHex Unsigned payload as hex text
     * @return payloadHex followed by the packet and key segments
     * @throws HexDecodeError if payloadHex is not valid hex
     */
    static std::string sign(const std::string& payloadHex);

    /**
     * @brief Sign and decode to the bytes written on the wire
     */
    static std::vector<uint8_t> signToBytes(const std::string& payloadHex);
};

} // namespace plug_protocol
