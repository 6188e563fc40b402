#pragma once

#include "plug_session/clock.hpp"
#include "plug_session/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plug_session {

/**
 * @class CommandVerifier
 * @brief Sends a power command and confirms it with at most two status polls
 *
 * The plug does not acknowledge control packets, and a packet with a wrong
 * device id is accepted silently. The only way to know a command worked is
 * to read the state back:
 *
 *   SENDING_COMMAND -> SETTLING -> FIRST_POLL -> CONFIRMED
 *                                     |
 *                                     +-> RETRY_WAIT -> SECOND_POLL -> CONFIRMED
 *                                                          |
 *                                                          +-> NOT_CONFIRMED
 *
 * Any transport failure moves to FAILED and keeps its own error code.
 * Transitions come from a static (state, event) table.
 */
class CommandVerifier {
public:
    enum class State {
        SENDING_COMMAND,
        SETTLING,
        FIRST_POLL,
        RETRY_WAIT,
        SECOND_POLL,
        CONFIRMED,
        NOT_CONFIRMED,
        FAILED
    };

    enum class Event {
        COMMAND_SENT,
        COMMAND_FAILED,
        DELAY_ELAPSED,
        STATE_MATCHED,
        STATE_MISMATCHED,
        POLL_FAILED
    };

    struct Config {
        std::chrono::milliseconds settleDelay{500};
        std::chrono::milliseconds retryDelay{1000};
    };

    using SendFunction = std::function<VoidResult()>;
    using PollFunction = std::function<Result<DeviceStatus>()>;

    CommandVerifier(const Config& config, std::shared_ptr<IClock> clock);

    /**
     * @brief Drive the machine from SENDING_COMMAND to a terminal state
     *
     * @param command Desired power state
     * @param send Sends the control packet
     * @param poll Reads the current status
     * @return Success on CONFIRMED, COMMAND_NOT_CONFIRMED on NOT_CONFIRMED,
     *         otherwise the error of the failed send or poll
     */
    VoidResult run(PowerCommand command, const SendFunction& send, const PollFunction& poll);

    /**
     * @brief Look up the transition table
     * @return Next state, or std::nullopt if the event is not valid in that state
     */
    static std::optional<State> nextState(State state, Event event);

    static bool isTerminal(State state);

    State state() const { return state_; }
    size_t pollCount() const { return pollCount_; }

    // Every state entered during the last run, starting with SENDING_COMMAND
    const std::vector<State>& trace() const { return trace_; }

    // State reported by the most recent successful poll
    std::optional<DeviceState> lastObservedState() const { return lastObserved_; }

private:
    void fire(Event event);
    void reset();

    Config config_;
    std::shared_ptr<IClock> clock_;

    State state_ = State::SENDING_COMMAND;
    size_t pollCount_ = 0;
    std::vector<State> trace_;
    std::optional<DeviceState> lastObserved_;
    VoidResult failure_;
};

std::string toString(CommandVerifier::State state);
std::string toString(CommandVerifier::Event event);

} // namespace plug_session
