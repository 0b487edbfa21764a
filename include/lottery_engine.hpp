#pragma once

#include "draw_config.hpp"
#include "event_log.hpp"
#include "ledger.hpp"
#include "lottery_errors.hpp"
#include "lottery_types.hpp"
#include "randomness_oracle.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lk {

// The one round of the process lifetime; reset in place after every payout.
struct LotteryRound {
    LotteryState state = LotteryState::OPEN;
    std::vector<Address> participants;
    Timestamp lastDrawTimestamp = 0;
    Address recentWinner;
};

struct UpkeepCheck {
    bool upkeepNeeded = false;
    std::string performData; // reserved, always empty
};

class LotteryEngine : public RandomnessConsumer {
public:
    LotteryEngine(Address address,
                  DrawConfig cfg,
                  LedgerPtr ledger,
                  ClockPtr clock,
                  OraclePtr oracle);

    // Moves `payment` from `sender` into the pot. Excess over the fee is not refunded.
    void enter(const Address& sender, Amount payment);

    // Time elapsed, round open, non-zero balance and at least one participant.
    bool isEligibleForDraw() const;
    UpkeepCheck checkUpkeep() const;

    // Closes entry and requests randomness. Open to any caller; eligibility is the only gate.
    RequestId triggerDraw();

    void rawFulfillRandomWords(const Address& caller,
                               RequestId requestId,
                               const std::vector<RandomWord>& randomWords) override;

    const Address& address() const { return address_; }
    const DrawConfig& config() const { return config_; }
    Amount entryFee() const { return config_.entryFee; }
    Timestamp interval() const { return config_.interval; }
    std::uint32_t numWords() const { return config_.oracle.numWords; }
    std::uint16_t requestConfirmations() const { return config_.oracle.requestConfirmations; }

    const Address& participant(std::size_t index) const;
    std::size_t participantCount() const { return round_.participants.size(); }
    const Address& recentWinner() const { return round_.recentWinner; }
    Timestamp lastDrawTimestamp() const { return round_.lastDrawTimestamp; }
    LotteryState state() const { return round_.state; }
    Amount balance() const;
    std::optional<RequestId> pendingRequest() const { return pendingRequest_; }

    const EventLog& events() const { return log_; }
    // Invoked after the operation that raised the event has committed, including the
    // payout for WINNER_PICKED. The callback must not throw: it runs in a noexcept context.
    void setEventCallback(LotteryEventCallback callback) { onEvent_ = std::move(callback); }

private:
    void fulfillDraw(RequestId requestId, const std::vector<RandomWord>& randomWords);
    void emit(const LotteryEvent& event);
    void notify(const LotteryEvent& event) const noexcept;

    Address address_;
    DrawConfig config_;
    LedgerPtr ledger_;
    ClockPtr clock_;
    OraclePtr oracle_;
    LotteryRound round_;
    std::optional<RequestId> pendingRequest_;
    EventLog log_;
    LotteryEventCallback onEvent_;
};

} // namespace lk
