#include "plug_session/command_verifier.hpp"

#include <spdlog/spdlog.h>

namespace plug_session {

namespace {

using State = CommandVerifier::State;
using Event = CommandVerifier::Event;

struct Transition {
    State from;
    Event event;
    State to;
};

constexpr Transition TRANSITIONS[] = {
    {State::SENDING_COMMAND, Event::COMMAND_SENT,     State::SETTLING},
    {State::SENDING_COMMAND, Event::COMMAND_FAILED,   State::FAILED},
    {State::SETTLING,        Event::DELAY_ELAPSED,    State::FIRST_POLL},
    {State::FIRST_POLL,      Event::STATE_MATCHED,    State::CONFIRMED},
    {State::FIRST_POLL,      Event::STATE_MISMATCHED, State::RETRY_WAIT},
    {State::FIRST_POLL,      Event::POLL_FAILED,      State::FAILED},
    {State::RETRY_WAIT,      Event::DELAY_ELAPSED,    State::SECOND_POLL},
    {State::SECOND_POLL,     Event::STATE_MATCHED,    State::CONFIRMED},
    {State::SECOND_POLL,     Event::STATE_MISMATCHED, State::NOT_CONFIRMED},
    {State::SECOND_POLL,     Event::POLL_FAILED,      State::FAILED},
};

} // namespace

std::string toString(CommandVerifier::State state) {
    switch (state) {
        case State::SENDING_COMMAND: return "SENDING_COMMAND";
        case State::SETTLING:        return "SETTLING";
        case State::FIRST_POLL:      return "FIRST_POLL";
        case State::RETRY_WAIT:      return "RETRY_WAIT";
        case State::SECOND_POLL:     return "SECOND_POLL";
        case State::CONFIRMED:       return "CONFIRMED";
        case State::NOT_CONFIRMED:   return "NOT_CONFIRMED";
        case State::FAILED:          return "FAILED";
        default:                     return "UNKNOWN";
    }
}

std::string toString(CommandVerifier::Event event) {
    switch (event) {
        case Event::COMMAND_SENT:     return "COMMAND_SENT";
        case Event::COMMAND_FAILED:   return "COMMAND_FAILED";
        case Event::DELAY_ELAPSED:    return "DELAY_ELAPSED";
        case Event::STATE_MATCHED:    return "STATE_MATCHED";
        case Event::STATE_MISMATCHED: return "STATE_MISMATCHED";
        case Event::POLL_FAILED:      return "POLL_FAILED";
        default:                      return "UNKNOWN";
    }
}

CommandVerifier::CommandVerifier(const Config& config, std::shared_ptr<IClock> clock)
    : config_(config)
    , clock_(std::move(clock))
{
}

std::optional<CommandVerifier::State> CommandVerifier::nextState(State state, Event event) {
    for (const auto& transition : TRANSITIONS) {
        if (transition.from == state && transition.event == event) {
            return transition.to;
        }
    }
    return std::nullopt;
}

bool CommandVerifier::isTerminal(State state) {
    return state == State::CONFIRMED || state == State::NOT_CONFIRMED || state == State::FAILED;
}

void CommandVerifier::reset() {
    state_ = State::SENDING_COMMAND;
    pollCount_ = 0;
    trace_.clear();
    trace_.push_back(state_);
    lastObserved_.reset();
    failure_ = makeSuccessResult();
}

void CommandVerifier::fire(Event event) {
    const auto next = nextState(state_, event);
    if (!next) {
        spdlog::error("No transition from {} on {}", toString(state_), toString(event));
        failure_ = makeErrorResult(ErrorCode::INTERNAL_ERROR,
            "Invalid verifier transition from " + toString(state_) + " on " + toString(event));
        state_ = State::FAILED;
    } else {
        spdlog::debug("Verifier {} --{}--> {}", toString(state_), toString(event), toString(*next));
        state_ = *next;
    }
    trace_.push_back(state_);
}

VoidResult CommandVerifier::run(PowerCommand command, const SendFunction& send, const PollFunction& poll) {
    reset();
    const DeviceState desired = plug_protocol::expectedState(command);

    while (!isTerminal(state_)) {
        switch (state_) {
            case State::SENDING_COMMAND: {
                VoidResult sent = send();
                if (sent) {
                    fire(Event::COMMAND_SENT);
                } else {
                    failure_ = sent;
                    fire(Event::COMMAND_FAILED);
                }
                break;
            }

            case State::SETTLING:
                spdlog::debug("Waiting {}ms before verifying command", config_.settleDelay.count());
                clock_->sleepFor(config_.settleDelay);
                fire(Event::DELAY_ELAPSED);
                break;

            case State::RETRY_WAIT:
                spdlog::warn("Device not {} after first poll, retrying after {}ms",
                             plug_protocol::toString(desired), config_.retryDelay.count());
                clock_->sleepFor(config_.retryDelay);
                fire(Event::DELAY_ELAPSED);
                break;

            case State::FIRST_POLL:
            case State::SECOND_POLL: {
                ++pollCount_;
                Result<DeviceStatus> status = poll();
                if (!status) {
                    failure_ = VoidResult::propagate(status);
                    fire(Event::POLL_FAILED);
                    break;
                }
                lastObserved_ = status.value.state;
                fire(status.value.state == desired ? Event::STATE_MATCHED : Event::STATE_MISMATCHED);
                break;
            }

            default:
                break;
        }
    }

    switch (state_) {
        case State::CONFIRMED:
            spdlog::info("Device confirmed {} after {} poll(s)", plug_protocol::toString(desired), pollCount_);
            return makeSuccessResult();

        case State::NOT_CONFIRMED:
            spdlog::error("Device failed to turn {} after retry - current state: {}",
                          plug_protocol::toString(command),
                          plug_protocol::toString(lastObserved_.value_or(DeviceState::UNKNOWN)));
            return makeErrorResult(ErrorCode::COMMAND_NOT_CONFIRMED,
                "Command sent but device did not turn " + plug_protocol::toString(command) +
                " (invalid device ID?)");

        default:
            return failure_;
    }
}

} // namespace plug_session
