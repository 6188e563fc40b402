#pragma once

#include <chrono>
#include <cstdint>

namespace plug_session {

/**
 * @class IClock
 * @brief Source of wall-clock time and delays for the session controller
 *
 * The verify-and-retry policy sleeps between polls; injecting the clock
 * lets tests run that policy without real delays.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Seconds since the Unix epoch, truncated to 32 bits
     */
    virtual uint32_t nowSeconds() = 0;

    /**
     * @brief Block the calling thread for the given duration
     */
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @class SystemClock
 * @brief IClock backed by std::chrono::system_clock and std::this_thread
 */
class SystemClock : public IClock {
public:
    uint32_t nowSeconds() override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

} // namespace plug_session
