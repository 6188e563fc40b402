#include "plug_session/command_verifier.hpp"
#include "mock_interfaces.hpp"

#include <gtest/gtest.h>

#include <deque>

using namespace plug_session;
using namespace std::chrono_literals;

class CommandVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        verifier_ = std::make_unique<CommandVerifier>(CommandVerifier::Config{}, clock_);
    }

    CommandVerifier::SendFunction sendSucceeds() {
        return [this] {
            ++sends_;
            return makeSuccessResult();
        };
    }

    // Each poll pops the next scripted status; running out is a test failure
    CommandVerifier::PollFunction pollReturns(std::deque<Result<DeviceStatus>> script) {
        script_ = std::move(script);
        return [this] {
            if (script_.empty()) {
                ADD_FAILURE() << "Unexpected extra status poll";
                return Result<DeviceStatus>::error(ErrorCode::INTERNAL_ERROR, "no more polls");
            }
            auto next = script_.front();
            script_.pop_front();
            return next;
        };
    }

    static Result<DeviceStatus> reports(DeviceState state) {
        DeviceStatus status;
        status.state = state;
        return Result<DeviceStatus>::ok(status);
    }

    std::shared_ptr<FakeClock> clock_;
    std::unique_ptr<CommandVerifier> verifier_;
    std::deque<Result<DeviceStatus>> script_;
    int sends_ = 0;
};

TEST_F(CommandVerifierTest, ImmediateMatchUsesOnePoll) {
    auto result = verifier_->run(PowerCommand::ON, sendSucceeds(), pollReturns({reports(DeviceState::ON)}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(sends_, 1);
    EXPECT_EQ(verifier_->pollCount(), 1u);
    EXPECT_EQ(verifier_->state(), CommandVerifier::State::CONFIRMED);
    EXPECT_EQ(clock_->sleeps(), std::vector<std::chrono::milliseconds>{500ms});

    const std::vector<CommandVerifier::State> expected = {
        CommandVerifier::State::SENDING_COMMAND,
        CommandVerifier::State::SETTLING,
        CommandVerifier::State::FIRST_POLL,
        CommandVerifier::State::CONFIRMED
    };
    EXPECT_EQ(verifier_->trace(), expected);
}

TEST_F(CommandVerifierTest, LateMatchUsesExactlyTwoPolls) {
    auto result = verifier_->run(PowerCommand::ON, sendSucceeds(),
                                 pollReturns({reports(DeviceState::OFF), reports(DeviceState::ON)}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(verifier_->pollCount(), 2u);
    EXPECT_EQ(verifier_->state(), CommandVerifier::State::CONFIRMED);
    EXPECT_EQ(clock_->sleeps(), (std::vector<std::chrono::milliseconds>{500ms, 1000ms}));
}

TEST_F(CommandVerifierTest, NeverMatchingFailsAfterTwoPolls) {
    auto result = verifier_->run(PowerCommand::ON, sendSucceeds(),
                                 pollReturns({reports(DeviceState::OFF), reports(DeviceState::OFF)}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::COMMAND_NOT_CONFIRMED);
    EXPECT_EQ(verifier_->pollCount(), 2u);
    EXPECT_EQ(verifier_->state(), CommandVerifier::State::NOT_CONFIRMED);
    EXPECT_TRUE(script_.empty());
    ASSERT_TRUE(verifier_->lastObservedState().has_value());
    EXPECT_EQ(*verifier_->lastObservedState(), DeviceState::OFF);
}

TEST_F(CommandVerifierTest, UnknownStateCountsAsMismatchForOff) {
    auto result = verifier_->run(PowerCommand::OFF, sendSucceeds(),
                                 pollReturns({reports(DeviceState::UNKNOWN), reports(DeviceState::OFF)}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(verifier_->pollCount(), 2u);
}

TEST_F(CommandVerifierTest, SendFailureKeepsItsErrorCode) {
    auto send = [] { return makeErrorResult(ErrorCode::CONNECT_ERROR, "unreachable"); };
    auto result = verifier_->run(PowerCommand::ON, send, pollReturns({}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::CONNECT_ERROR);
    EXPECT_EQ(verifier_->state(), CommandVerifier::State::FAILED);
    EXPECT_EQ(verifier_->pollCount(), 0u);
    EXPECT_TRUE(clock_->sleeps().empty());
}

TEST_F(CommandVerifierTest, PollFailureIsNotReportedAsUnconfirmed) {
    auto result = verifier_->run(PowerCommand::ON, sendSucceeds(),
        pollReturns({reports(DeviceState::OFF),
                     Result<DeviceStatus>::error(ErrorCode::TIMEOUT, "read timed out")}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::TIMEOUT);
    EXPECT_EQ(verifier_->pollCount(), 2u);
    EXPECT_EQ(verifier_->state(), CommandVerifier::State::FAILED);
}

TEST_F(CommandVerifierTest, RunResetsBetweenCommands) {
    verifier_->run(PowerCommand::ON, sendSucceeds(),
                   pollReturns({reports(DeviceState::OFF), reports(DeviceState::OFF)}));
    auto result = verifier_->run(PowerCommand::OFF, sendSucceeds(), pollReturns({reports(DeviceState::OFF)}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(verifier_->pollCount(), 1u);
    EXPECT_EQ(verifier_->trace().size(), 4u);
}

TEST(CommandVerifierTableTest, TerminalStatesHaveNoTransitions) {
    using State = CommandVerifier::State;
    using Event = CommandVerifier::Event;

    const Event events[] = {
        Event::COMMAND_SENT, Event::COMMAND_FAILED, Event::DELAY_ELAPSED,
        Event::STATE_MATCHED, Event::STATE_MISMATCHED, Event::POLL_FAILED
    };
    for (State terminal : {State::CONFIRMED, State::NOT_CONFIRMED, State::FAILED}) {
        EXPECT_TRUE(CommandVerifier::isTerminal(terminal));
        for (Event event : events) {
            EXPECT_FALSE(CommandVerifier::nextState(terminal, event).has_value())
                << toString(terminal) << " on " << toString(event);
        }
    }
}

TEST(CommandVerifierTableTest, SecondMismatchNeverLeadsToAnotherPoll) {
    using State = CommandVerifier::State;
    using Event = CommandVerifier::Event;

    EXPECT_EQ(CommandVerifier::nextState(State::FIRST_POLL, Event::STATE_MISMATCHED), State::RETRY_WAIT);
    EXPECT_EQ(CommandVerifier::nextState(State::SECOND_POLL, Event::STATE_MISMATCHED), State::NOT_CONFIRMED);
    EXPECT_FALSE(CommandVerifier::nextState(State::SETTLING, Event::STATE_MATCHED).has_value());
}
