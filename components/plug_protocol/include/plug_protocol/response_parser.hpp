#pragma once

#include "plug_protocol/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plug_protocol {

/**
 * @brief Interprets the replies a plug sends over the TCP session
 *
 * Replies are not signed and carry no length field worth trusting, so each
 * reader only checks the minimum length it needs and pulls fixed offsets.
 */
class ResponseParser {
public:
    static constexpr size_t MIN_LOGIN_RESPONSE_SIZE = 20;
    static constexpr size_t MIN_STATUS_RESPONSE_SIZE = 50;
    static constexpr size_t MIN_RENAME_RESPONSE_SIZE = 20;

    static constexpr size_t SESSION_ID_OFFSET = 16;
    static constexpr size_t SESSION_ID_LENGTH = 4;
    static constexpr size_t STATE_OFFSET = 75;
    static constexpr size_t POWER_OFFSET = 77;

    /**
     * @brief Extract the session id from a login reply
     * @return 8 lowercase hex characters, or std::nullopt if the reply is shorter than 20 bytes
     */
    static std::optional<std::string> parseSessionId(const std::vector<uint8_t>& response);

    /**
     * @brief Read state and power from a status reply
     * @return std::nullopt if the reply is shorter than 50 bytes
     *
     * A reply too short to reach the state byte reports OFF, one too short
     * to reach the power field reports 0 watts.
     */
    static std::optional<DeviceStatus> parseStatus(const std::vector<uint8_t>& response);

    /**
     * @brief True if a rename reply is long enough to count as an acknowledgement
     */
    static bool isRenameAcknowledged(const std::vector<uint8_t>& response);

    /**
     * @brief Map a raw state byte to a device state
     */
    static DeviceState stateFromByte(uint8_t value);
};

} // namespace plug_protocol
