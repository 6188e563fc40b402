#include "plug_protocol/response_parser.hpp"
#include "plug_protocol/hex.hpp"

namespace plug_protocol {

std::optional<std::string> ResponseParser::parseSessionId(const std::vector<uint8_t>& response) {
    if (response.size() < MIN_LOGIN_RESPONSE_SIZE) {
        return std::nullopt;
    }
    return hex::encode(response.data() + SESSION_ID_OFFSET, SESSION_ID_LENGTH);
}

std::optional<DeviceStatus> ResponseParser::parseStatus(const std::vector<uint8_t>& response) {
    if (response.size() < MIN_STATUS_RESPONSE_SIZE) {
        return std::nullopt;
    }

    DeviceStatus status;
    status.state = response.size() > STATE_OFFSET
        ? stateFromByte(response[STATE_OFFSET])
        : DeviceState::OFF;

    if (response.size() > POWER_OFFSET + 1) {
        status.powerConsumption = static_cast<uint16_t>(
            response[POWER_OFFSET] | (static_cast<uint16_t>(response[POWER_OFFSET + 1]) << 8));
    }

    return status;
}

bool ResponseParser::isRenameAcknowledged(const std::vector<uint8_t>& response) {
    return response.size() >= MIN_RENAME_RESPONSE_SIZE;
}

DeviceState ResponseParser::stateFromByte(uint8_t value) {
    switch (value) {
        case 0x01:
            return DeviceState::ON;
        case 0x00:
            return DeviceState::OFF;
        default:
            return DeviceState::UNKNOWN;
    }
}

} // namespace plug_protocol
