#include "plugctl/target_resolver.hpp"

#include <spdlog/spdlog.h>

namespace plugctl {

Result<DeviceTarget> resolveTarget(const TargetOptions& options, device_store::IPairingStore& pairingStore) {
    const bool hasIp = options.ipAddress.has_value();
    const bool hasId = options.deviceId.has_value();
    const bool hasAlias = options.alias.has_value();

    if (hasAlias) {
        if (hasIp && hasId) {
            return Result<DeviceTarget>::error(ErrorCode::INVALID_ARGUMENT,
                "Cannot specify both IP/device-id and alias. Use either --ip and --device-id, or --alias.");
        }
        if (hasIp || hasId) {
            return Result<DeviceTarget>::error(ErrorCode::INVALID_ARGUMENT,
                "Cannot mix IP/device-id with alias. Use either --ip and --device-id, or --alias.");
        }

        auto target = pairingStore.resolve(*options.alias);
        if (!target) {
            return Result<DeviceTarget>::error(ErrorCode::NOT_FOUND,
                "No paired device found with alias '" + *options.alias + "'");
        }
        spdlog::debug("Resolved alias '{}' to {} at {}", *options.alias, target->deviceId, target->ipAddress);
        return Result<DeviceTarget>::ok(*target);
    }

    if (hasIp && hasId) {
        return Result<DeviceTarget>::ok(DeviceTarget{*options.ipAddress, *options.deviceId});
    }
    if (hasIp || hasId) {
        return Result<DeviceTarget>::error(ErrorCode::INVALID_ARGUMENT,
            "When using IP/device-id, both --ip and --device-id are required.");
    }
    return Result<DeviceTarget>::error(ErrorCode::INVALID_ARGUMENT,
        "Must specify either --ip and --device-id, or --alias for a paired device.");
}

} // namespace plugctl
