#include "plug_protocol/signer.hpp"
#include "plug_protocol/hex.hpp"

#include <boost/crc.hpp>

namespace plug_protocol {

namespace {

using DeviceCrc = boost::crc_optimal<16, Crc16::POLYNOMIAL, 0, 0, false, false>;

} // namespace

void Crc16::update(const uint8_t* data, size_t length) {
    // No reflection and no final XOR, so the checksum is the raw register
    // and can seed the next chunk
    DeviceCrc crc(register_);
    crc.process_bytes(data, length);
    register_ = crc.checksum();
}

uint16_t Crc16::compute(const std::vector<uint8_t>& data, uint16_t seed) {
    Crc16 crc(seed);
    crc.update(data);
    return crc.finalize();
}

std::string PacketSigner::swappedHex(uint16_t crc) {
    // Big-endian rendering is hi,lo; the device expects lo,hi
    const uint8_t swapped[2] = {
        static_cast<uint8_t>(crc & 0xFF),
        static_cast<uint8_t>(crc >> 8)
    };
    return hex::encode(swapped, sizeof(swapped));
}

std::string PacketSigner::packetCrcSegment(const std::vector<uint8_t>& payload) {
    return swappedHex(Crc16::compute(payload));
}

std::string PacketSigner::keyCrcSegment(const std::string& packetCrcSegment) {
    std::vector<uint8_t> key = hex::decode(packetCrcSegment);
    key.insert(key.end(), KEY_PADDING_BYTES, static_cast<uint8_t>('0'));
    return swappedHex(Crc16::compute(key));
}

std::string PacketSigner::sign(const std::string& payloadHex) {
    const std::vector<uint8_t> payload = hex::decode(payloadHex);
    const std::string packetSegment = packetCrcSegment(payload);
    return payloadHex + packetSegment + keyCrcSegment(packetSegment);
}

std::vector<uint8_t> PacketSigner::signToBytes(const std::string& payloadHex) {
    return hex::decode(sign(payloadHex));
}

} // namespace plug_protocol
