#include "plug_protocol/discovery_decoder.hpp"
#include "plug_protocol/hex.hpp"

#include <cstdio>
#include <sstream>

namespace plug_protocol {

namespace {

constexpr uint8_t POWER_PLUG_TYPE_HI = 0x01;
constexpr uint8_t POWER_PLUG_TYPE_LO = 0xA8;
constexpr uint8_t STATE_ON = 0x01;

const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Length of a well-formed UTF-8 sequence starting at data[0], or 0 if malformed
size_t validSequenceLength(const uint8_t* data, size_t remaining) {
    const uint8_t lead = data[0];
    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    uint8_t minSecond = 0x80;
    uint8_t maxSecond = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) minSecond = 0xA0;
        if (lead == 0xED) maxSecond = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) minSecond = 0x90;
        if (lead == 0xF4) maxSecond = 0x8F;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    if (data[1] < minSecond || data[1] > maxSecond) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (data[i] < 0x80 || data[i] > 0xBF) {
            return 0;
        }
    }
    return length;
}

// Number of leading bytes of a malformed sequence that form a valid prefix,
// at least 1. Each maximal invalid prefix is replaced by one U+FFFD.
size_t invalidPrefixLength(const uint8_t* data, size_t remaining) {
    const uint8_t lead = data[0];
    size_t expected = 0;
    uint8_t minSecond = 0x80;
    uint8_t maxSecond = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        expected = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        expected = 3;
        if (lead == 0xE0) minSecond = 0xA0;
        if (lead == 0xED) maxSecond = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        expected = 4;
        if (lead == 0xF0) minSecond = 0x90;
        if (lead == 0xF4) maxSecond = 0x8F;
    } else {
        return 1;
    }

    size_t consumed = 1;
    if (consumed < remaining && data[1] >= minSecond && data[1] <= maxSecond) {
        ++consumed;
        while (consumed < expected && consumed < remaining &&
               data[consumed] >= 0x80 && data[consumed] <= 0xBF) {
            ++consumed;
        }
    }
    return consumed;
}

} // namespace

std::string decodeUtf8Lossy(const uint8_t* data, size_t length) {
    std::string result;
    result.reserve(length);

    size_t pos = 0;
    while (pos < length) {
        const size_t valid = validSequenceLength(data + pos, length - pos);
        if (valid > 0) {
            result.append(reinterpret_cast<const char*>(data + pos), valid);
            pos += valid;
        } else {
            result.append(REPLACEMENT_CHARACTER);
            pos += invalidPrefixLength(data + pos, length - pos);
        }
    }
    return result;
}

std::optional<DeviceRecord> decodeDiscoveryPacket(const std::vector<uint8_t>& packet) {
    return DiscoveryDecoder::decode(packet);
}

std::optional<DeviceRecord> DiscoveryDecoder::decode(const std::vector<uint8_t>& packet) {
    return decode(packet.data(), packet.size());
}

bool DiscoveryDecoder::isPowerPlugPacket(const uint8_t* data, size_t length) {
    if (data == nullptr || length != PACKET_SIZE) {
        return false;
    }
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1) {
        return false;
    }
    return data[TYPE_OFFSET] == POWER_PLUG_TYPE_HI && data[TYPE_OFFSET + 1] == POWER_PLUG_TYPE_LO;
}

std::optional<DeviceRecord> DiscoveryDecoder::decode(const uint8_t* data, size_t length) {
    if (!isPowerPlugPacket(data, length)) {
        return std::nullopt;
    }

    DeviceRecord record;
    record.deviceId = hex::encode(data + DEVICE_ID_OFFSET, DEVICE_ID_LENGTH);
    record.deviceKey = hex::encode(data + DEVICE_KEY_OFFSET, 1);
    record.name = decodeName(data + NAME_OFFSET, NAME_LENGTH);
    record.deviceType = POWER_PLUG_DEVICE_TYPE;
    record.ipAddress = formatIpAddress(data + IP_OFFSET);
    record.macAddress = formatMacAddress(data + MAC_OFFSET);

    // Broadcasts only distinguish On from everything else; status replies
    // have a separate Unknown state.
    record.state = data[STATE_OFFSET] == STATE_ON ? DeviceState::ON : DeviceState::OFF;

    // Little-endian u16; the two bytes after it are ignored
    record.powerConsumption = static_cast<uint16_t>(
        data[POWER_OFFSET] | (static_cast<uint16_t>(data[POWER_OFFSET + 1]) << 8));

    return record;
}

std::string DiscoveryDecoder::decodeName(const uint8_t* field, size_t length) {
    size_t end = 0;
    while (end < length && field[end] != 0) {
        ++end;
    }
    return decodeUtf8Lossy(field, end);
}

std::string DiscoveryDecoder::formatIpAddress(const uint8_t* field) {
    std::ostringstream oss;
    oss << static_cast<int>(field[0]) << '.'
        << static_cast<int>(field[1]) << '.'
        << static_cast<int>(field[2]) << '.'
        << static_cast<int>(field[3]);
    return oss.str();
}

std::string DiscoveryDecoder::formatMacAddress(const uint8_t* field) {
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
                  field[0], field[1], field[2], field[3], field[4], field[5]);
    return std::string(buffer);
}

} // namespace plug_protocol
