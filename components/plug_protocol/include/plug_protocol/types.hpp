#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace plug_protocol {

// Hex-encoded 3-byte device identifier (6 characters)
using DeviceId = std::string;

// Power state reported by a plug
enum class DeviceState {
    ON,
    OFF,
    UNKNOWN
};

// Command digit embedded in a control packet
enum class PowerCommand {
    OFF,
    ON
};

// Human label for the only supported device family (type code 0x01A8)
inline constexpr const char* POWER_PLUG_DEVICE_TYPE = "Switcher Power Plug";

// One physical plug as advertised in a discovery broadcast
struct DeviceRecord {
    DeviceId deviceId;
    std::string deviceKey;
    std::string ipAddress;
    std::string macAddress;
    std::string name;
    std::string deviceType;
    DeviceState state = DeviceState::UNKNOWN;
    uint16_t powerConsumption = 0;
};

// State and power read back from a status reply
struct DeviceStatus {
    DeviceState state = DeviceState::OFF;
    uint16_t powerConsumption = 0;
};

// Values produced by a successful login, valid for one TCP connection
struct SessionHandshake {
    std::string timestampHex;
    std::string sessionIdHex;
};

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    CONNECT_ERROR = 1,
    TIMEOUT = 2,
    TRANSPORT_ERROR = 3,
    LOGIN_TOO_SHORT = 4,
    NO_RESPONSE = 5,
    NO_OR_INVALID_DEVICE = 6,
    INVALID_NAME_LENGTH = 7,
    INVALID_DEVICE_ID = 8,
    COMMAND_NOT_CONFIRMED = 9,
    BIND_ERROR = 10,
    INVALID_ARGUMENT = 11,
    NOT_FOUND = 12,
    STORE_ERROR = 13,
    INTERNAL_ERROR = 14
};

// Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return "SUCCESS";
        case ErrorCode::CONNECT_ERROR:         return "CONNECT_ERROR";
        case ErrorCode::TIMEOUT:               return "TIMEOUT";
        case ErrorCode::TRANSPORT_ERROR:       return "TRANSPORT_ERROR";
        case ErrorCode::LOGIN_TOO_SHORT:       return "LOGIN_TOO_SHORT";
        case ErrorCode::NO_RESPONSE:           return "NO_RESPONSE";
        case ErrorCode::NO_OR_INVALID_DEVICE:  return "NO_OR_INVALID_DEVICE";
        case ErrorCode::INVALID_NAME_LENGTH:   return "INVALID_NAME_LENGTH";
        case ErrorCode::INVALID_DEVICE_ID:     return "INVALID_DEVICE_ID";
        case ErrorCode::COMMAND_NOT_CONFIRMED: return "COMMAND_NOT_CONFIRMED";
        case ErrorCode::BIND_ERROR:            return "BIND_ERROR";
        case ErrorCode::INVALID_ARGUMENT:      return "INVALID_ARGUMENT";
        case ErrorCode::NOT_FOUND:             return "NOT_FOUND";
        case ErrorCode::STORE_ERROR:           return "STORE_ERROR";
        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
        default:                               return "UNKNOWN_ERROR";
    }
}

// Result structure for operations
template<typename T>
struct Result {
    bool success = false;
    ErrorCode errorCode = ErrorCode::SUCCESS;
    std::string errorMessage;
    T value;

    static Result<T> ok(const T& value) {
        Result<T> result;
        result.success = true;
        result.value = value;
        return result;
    }

    static Result<T> error(ErrorCode code, const std::string& message) {
        Result<T> result;
        result.success = false;
        result.errorCode = code;
        result.errorMessage = message;
        return result;
    }

    // Carry the failure of another result over to this value type
    template<typename U>
    static Result<T> propagate(const Result<U>& other) {
        return error(other.errorCode, other.errorMessage);
    }

    explicit operator bool() const {
        return success;
    }
};

// Void result for operations without return value
using VoidResult = Result<bool>;

inline VoidResult makeSuccessResult() {
    return Result<bool>::ok(true);
}

inline VoidResult makeErrorResult(ErrorCode code, const std::string& message) {
    return Result<bool>::error(code, message);
}

std::string toString(DeviceState state);
std::string toString(PowerCommand command);

// "On" / "Off" / "Unknown"; unrecognized text maps to UNKNOWN
DeviceState deviceStateFromString(const std::string& text);

// State a device should report once the command has taken effect
DeviceState expectedState(PowerCommand command);

} // namespace plug_protocol
