#pragma once

#include "plug_protocol/types.hpp"

#include <cstdint>
#include <map>
#include <string>

#ifndef PLUGCTL_VERSION
#define PLUGCTL_VERSION "0.1.0"
#endif

namespace device_store {

using plug_protocol::DeviceId;
using plug_protocol::DeviceRecord;
using plug_protocol::ErrorCode;
using plug_protocol::Result;
using plug_protocol::VoidResult;
using plug_protocol::makeErrorResult;
using plug_protocol::makeSuccessResult;

// Seconds since the Unix epoch
using Timestamp = uint64_t;

// Version written to and expected in the store file
inline constexpr const char* STORE_VERSION = PLUGCTL_VERSION;

// Default store file name, placed beside the executable
inline constexpr const char* DEFAULT_STORE_FILE_NAME = "switcher_config.json";

// A discovered device with its cache bookkeeping
struct CachedDevice {
    DeviceRecord device;
    Timestamp lastSeen = 0;
    uint32_t discoveryCount = 0;
};

using CachedDeviceMap = std::map<DeviceId, CachedDevice>;

// A device the user has given an alias
struct PairedDevice {
    DeviceRecord device;
    std::string alias;
    Timestamp pairedAt = 0;
    Timestamp lastSeen = 0;
};

// Everything needed to open a session with a device
struct DeviceTarget {
    std::string ipAddress;
    DeviceId deviceId;
};

Timestamp currentTimestamp();

/**
 * @brief Describe how long ago a timestamp was, e.g. "5 minutes ago"
 */
std::string formatRelativeTime(Timestamp timestamp, Timestamp now);

} // namespace device_store
