#pragma once

#include "plug_protocol/types.hpp"

namespace plug_session {

// Session code reports errors with the protocol library's Result types
using plug_protocol::ErrorCode;
using plug_protocol::Result;
using plug_protocol::VoidResult;
using plug_protocol::makeErrorResult;
using plug_protocol::makeSuccessResult;

using plug_protocol::DeviceId;
using plug_protocol::DeviceState;
using plug_protocol::DeviceStatus;
using plug_protocol::PowerCommand;

} // namespace plug_session
