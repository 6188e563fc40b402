#include "plug_protocol/types.hpp"

namespace plug_protocol {

std::string toString(DeviceState state) {
    switch (state) {
        case DeviceState::ON:
            return "On";
        case DeviceState::OFF:
            return "Off";
        case DeviceState::UNKNOWN:
            return "Unknown";
        default:
            return "Unknown";
    }
}

std::string toString(PowerCommand command) {
    switch (command) {
        case PowerCommand::ON:
            return "ON";
        case PowerCommand::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

DeviceState deviceStateFromString(const std::string& text) {
    if (text == "On") {
        return DeviceState::ON;
    }
    if (text == "Off") {
        return DeviceState::OFF;
    }
    return DeviceState::UNKNOWN;
}

DeviceState expectedState(PowerCommand command) {
    return command == PowerCommand::ON ? DeviceState::ON : DeviceState::OFF;
}

} // namespace plug_protocol
