#pragma once

#include "plug_protocol/types.hpp"

#include <cstdint>

namespace plug_discovery {

using plug_protocol::DeviceId;
using plug_protocol::DeviceRecord;
using plug_protocol::ErrorCode;
using plug_protocol::Result;
using plug_protocol::VoidResult;
using plug_protocol::makeErrorResult;
using plug_protocol::makeSuccessResult;

// Counters for one listener, reset on every start()
struct ListenerStatistics {
    uint64_t packetsReceived = 0;
    uint64_t bytesReceived = 0;
    uint64_t devicesDiscovered = 0;
    uint64_t duplicateSightings = 0;
    uint64_t packetsIgnored = 0;
};

} // namespace plug_discovery
