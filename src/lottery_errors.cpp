#include "lottery_errors.hpp"

#include <sstream>
#include <utility>

namespace lk {

namespace {

std::string insufficientPaymentMessage(Amount paid, Amount required) {
    std::ostringstream oss;
    oss << "insufficient payment: paid " << paid << ", entry fee is " << required;
    return oss.str();
}

std::string upkeepMessage(Amount balance, std::size_t participants, LotteryState state) {
    std::ostringstream oss;
    oss << "upkeep not needed: balance=" << balance << " participants=" << participants
        << " state=" << toString(state);
    return oss.str();
}

std::string payoutMessage(const Address& winner, Amount amount, const std::string& reason) {
    std::ostringstream oss;
    oss << "payout of " << amount << " to " << winner << " failed: " << reason
        << " (round already reset, funds remain in the holding account)";
    return oss.str();
}

} // namespace

InsufficientPayment::InsufficientPayment(Amount paid, Amount required)
    : LotteryError(insufficientPaymentMessage(paid, required))
    , paid_(paid)
    , required_(required) {}

UpkeepNotNeeded::UpkeepNotNeeded(Amount balance, std::size_t participants, LotteryState state)
    : LotteryError(upkeepMessage(balance, participants, state))
    , balance_(balance)
    , participants_(participants)
    , state_(state) {}

PayoutFailed::PayoutFailed(Address winner, Amount amount, const std::string& reason)
    : LotteryError(payoutMessage(winner, amount, reason))
    , winner_(std::move(winner))
    , amount_(amount) {}

OnlyOracleCanFulfill::OnlyOracleCanFulfill(Address have, Address want)
    : LotteryError("only the oracle " + want + " can fulfill, caller was " + have)
    , have_(std::move(have))
    , want_(std::move(want)) {}

UnknownDrawRequest::UnknownDrawRequest(RequestId requestId)
    : LotteryError("fulfillment for request " + std::to_string(requestId) +
                   " does not match an outstanding draw")
    , requestId_(requestId) {}

} // namespace lk
