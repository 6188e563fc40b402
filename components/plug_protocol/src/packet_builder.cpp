#include "plug_protocol/packet_builder.hpp"
#include "plug_protocol/error.hpp"
#include "plug_protocol/hex.hpp"
#include "plug_protocol/signer.hpp"

#include <cstdio>
#include <sstream>

namespace plug_protocol {

namespace {

// Shared between the session header and the device field of every packet
constexpr const char* SESSION_PREFIX_TAIL = "340001000000000000000000";
constexpr const char* TIMESTAMP_TAIL = "00000000000000000000f0fe";

const std::string PAD_72_ZEROS(72, '0');

bool isHexOfLength(const std::string& value, size_t length) {
    return value.size() == length && hex::isHex(value);
}

} // namespace

std::string toString(PacketType type) {
    switch (type) {
        case PacketType::LOGIN:
            return "LOGIN";
        case PacketType::GET_STATE:
            return "GET_STATE";
        case PacketType::CONTROL:
            return "CONTROL";
        case PacketType::RENAME:
            return "RENAME";
        default:
            return "UNKNOWN";
    }
}

PacketBuilder::PacketBuilder(PacketType type)
    : type_(type)
{
}

PacketBuilder PacketBuilder::create(PacketType type) {
    return PacketBuilder(type);
}

PacketBuilder& PacketBuilder::setTimestamp(const std::string& timestampHex) {
    if (!isHexOfLength(timestampHex, 8)) {
        throw ValidationError("Timestamp must be 8 hex characters, got '" + timestampHex + "'");
    }
    timestampHex_ = timestampHex;
    return *this;
}

PacketBuilder& PacketBuilder::setSessionId(const std::string& sessionIdHex) {
    if (!isHexOfLength(sessionIdHex, 8)) {
        throw ValidationError("Session ID must be 8 hex characters, got '" + sessionIdHex + "'");
    }
    sessionIdHex_ = sessionIdHex;
    return *this;
}

PacketBuilder& PacketBuilder::setDeviceId(const std::string& deviceId) {
    if (!isHexOfLength(deviceId, 6)) {
        throw InvalidDeviceIdError(deviceId);
    }
    deviceId_ = deviceId;
    return *this;
}

PacketBuilder& PacketBuilder::setCommand(PowerCommand command) {
    command_ = command;
    commandSet_ = true;
    return *this;
}

PacketBuilder& PacketBuilder::setDeviceName(const std::string& name) {
    nameHex_ = encodeDeviceName(name);
    return *this;
}

void PacketBuilder::require(const std::string& value, const char* field) const {
    if (value.empty()) {
        throw ValidationError(std::string(field) + " must be set before building " + toString(type_) + " packet");
    }
}

std::string PacketBuilder::build() const {
    require(timestampHex_, "Timestamp");

    std::ostringstream oss;
    switch (type_) {
        case PacketType::LOGIN:
            oss << "fef052000232a10000000000" << SESSION_PREFIX_TAIL
                << timestampHex_ << TIMESTAMP_TAIL
                << "00" << PAD_72_ZEROS << "00";
            break;

        case PacketType::GET_STATE:
            require(sessionIdHex_, "Session ID");
            require(deviceId_, "Device ID");
            oss << "fef0300002320103" << sessionIdHex_ << SESSION_PREFIX_TAIL
                << timestampHex_ << TIMESTAMP_TAIL
                << deviceId_ << "00";
            break;

        case PacketType::CONTROL:
            require(sessionIdHex_, "Session ID");
            require(deviceId_, "Device ID");
            if (!commandSet_) {
                throw ValidationError("Command must be set before building CONTROL packet");
            }
            oss << "fef05d0002320102" << sessionIdHex_ << SESSION_PREFIX_TAIL
                << timestampHex_ << TIMESTAMP_TAIL
                << deviceId_ << PAD_72_ZEROS
                << "000106000" << (command_ == PowerCommand::ON ? '1' : '0')
                << "00" << "00000000";
            break;

        case PacketType::RENAME:
            require(sessionIdHex_, "Session ID");
            require(deviceId_, "Device ID");
            require(nameHex_, "Device name");
            oss << "fef0740002320202" << sessionIdHex_ << SESSION_PREFIX_TAIL
                << timestampHex_ << TIMESTAMP_TAIL
                << deviceId_ << PAD_72_ZEROS
                << "00" << nameHex_;
            break;
    }

    return oss.str();
}

std::string PacketBuilder::buildSigned() const {
    return PacketSigner::sign(build());
}

std::vector<uint8_t> PacketBuilder::toBinary() const {
    return PacketSigner::signToBytes(build());
}

std::string PacketBuilder::encodeDeviceName(const std::string& name) {
    // std::string length is the UTF-8 byte count
    const size_t length = name.size();
    if (length < MIN_NAME_BYTES || length > MAX_NAME_BYTES) {
        throw InvalidNameLengthError(length);
    }

    std::string nameHex = hex::encode(reinterpret_cast<const uint8_t*>(name.data()), name.size());
    nameHex.append(NAME_FIELD_HEX_LENGTH - nameHex.size(), '0');
    return nameHex;
}

std::string PacketBuilder::formatTimestamp(uint32_t secondsSinceEpoch) {
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", secondsSinceEpoch);
    return std::string(buffer);
}

} // namespace plug_protocol
