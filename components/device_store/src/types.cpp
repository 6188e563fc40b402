#include "device_store/types.hpp"

#include <chrono>

namespace device_store {

Timestamp currentTimestamp() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::string formatRelativeTime(Timestamp timestamp, Timestamp now) {
    if (timestamp > now) {
        return "in the future";
    }

    const Timestamp elapsed = now - timestamp;
    if (elapsed < 60) {
        return std::to_string(elapsed) + " seconds ago";
    }
    if (elapsed < 3600) {
        return std::to_string(elapsed / 60) + " minutes ago";
    }
    if (elapsed < 86400) {
        return std::to_string(elapsed / 3600) + " hours ago";
    }
    return std::to_string(elapsed / 86400) + " days ago";
}

} // namespace device_store
