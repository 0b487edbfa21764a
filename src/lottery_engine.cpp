#include "lottery_engine.hpp"

#include <stdexcept>
#include <utility>

namespace lk {

namespace {

std::size_t pickWinnerIndex(const RandomWord& word, std::size_t participantCount) {
    // Unreachable through triggerDraw; reported instead of faulting on modulo by zero.
    if (participantCount == 0) {
        throw std::logic_error("draw fulfilled with no participants");
    }
    RandomWord index = word % RandomWord(participantCount);
    return index.convert_to<std::size_t>();
}

} // namespace

LotteryEngine::LotteryEngine(Address address,
                             DrawConfig cfg,
                             LedgerPtr ledger,
                             ClockPtr clock,
                             OraclePtr oracle)
    : address_(std::move(address))
    , config_(std::move(cfg))
    , ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , oracle_(std::move(oracle)) {
    if (address_.empty()) {
        throw std::invalid_argument("engine address must not be empty");
    }
    if (!ledger_ || !clock_ || !oracle_) {
        throw std::invalid_argument("engine requires a ledger, a clock and an oracle");
    }
    config_.validate();
    if (oracle_->address() != config_.oracle.coordinator) {
        throw std::invalid_argument("oracle address does not match configured coordinator " +
                                    config_.oracle.coordinator);
    }
    round_.lastDrawTimestamp = clock_->now();
}

void LotteryEngine::enter(const Address& sender, Amount payment) {
    if (sender.empty()) {
        throw std::invalid_argument("sender must not be empty");
    }
    if (payment < config_.entryFee) {
        throw InsufficientPayment(payment, config_.entryFee);
    }
    if (round_.state != LotteryState::OPEN) {
        throw RoundNotOpen();
    }

    ledger_->transfer(sender, address_, payment);
    round_.participants.push_back(sender);
    emit(LotteryEvent{ LotteryEventKind::ENTERED, sender, 0, payment, clock_->now() });
}

bool LotteryEngine::isEligibleForDraw() const {
    Timestamp now = clock_->now();
    bool timePassed = now >= round_.lastDrawTimestamp &&
                      now - round_.lastDrawTimestamp >= config_.interval;
    bool isOpen = round_.state == LotteryState::OPEN;
    bool hasBalance = balance() > 0;
    bool hasPlayers = !round_.participants.empty();
    return timePassed && isOpen && hasBalance && hasPlayers;
}

UpkeepCheck LotteryEngine::checkUpkeep() const {
    return UpkeepCheck{ isEligibleForDraw(), std::string() };
}

RequestId LotteryEngine::triggerDraw() {
    if (!isEligibleForDraw()) {
        throw UpkeepNotNeeded(balance(), round_.participants.size(), round_.state);
    }

    // Closed before the request goes out so a reentrant trigger fails eligibility.
    round_.state = LotteryState::DRAWING;

    RandomWordsRequest request;
    request.keyHash = config_.oracle.keyHash;
    request.subscriptionId = config_.oracle.subscriptionId;
    request.requestConfirmations = config_.oracle.requestConfirmations;
    request.callbackGasLimit = config_.oracle.callbackGasLimit;
    request.numWords = config_.oracle.numWords;
    request.nativePayment = config_.oracle.nativePayment;

    RequestId requestId = 0;
    try {
        requestId = oracle_->requestRandomWords(request, *this);
    } catch (const std::exception&) {
        round_.state = LotteryState::OPEN;
        throw;
    }

    pendingRequest_ = requestId;
    emit(LotteryEvent{ LotteryEventKind::DRAW_REQUESTED, Address(), requestId, 0, clock_->now() });
    return requestId;
}

void LotteryEngine::rawFulfillRandomWords(const Address& caller,
                                          RequestId requestId,
                                          const std::vector<RandomWord>& randomWords) {
    if (caller != config_.oracle.coordinator) {
        throw OnlyOracleCanFulfill(caller, config_.oracle.coordinator);
    }
    if (round_.state != LotteryState::DRAWING || !pendingRequest_ || *pendingRequest_ != requestId) {
        throw UnknownDrawRequest(requestId);
    }
    fulfillDraw(requestId, randomWords);
}

void LotteryEngine::fulfillDraw(RequestId requestId, const std::vector<RandomWord>& randomWords) {
    if (randomWords.empty()) {
        throw std::invalid_argument("fulfillment carried no random words");
    }

    std::size_t winnerIndex = pickWinnerIndex(randomWords.front(), round_.participants.size());
    round_.recentWinner = round_.participants[winnerIndex];
    round_.state = LotteryState::OPEN;
    round_.participants.clear();
    round_.lastDrawTimestamp = clock_->now();
    pendingRequest_.reset();

    const Address winner = round_.recentWinner;
    const Amount pot = balance();
    const LotteryEvent picked{
        LotteryEventKind::WINNER_PICKED, winner, requestId, pot, round_.lastDrawTimestamp };
    log_.append(picked);

    try {
        ledger_->transfer(address_, winner, pot);
    } catch (const TransferRejected& ex) {
        notify(picked);
        throw PayoutFailed(winner, pot, ex.what());
    }
    notify(picked);
}

const Address& LotteryEngine::participant(std::size_t index) const {
    if (index >= round_.participants.size()) {
        throw std::out_of_range("participant index " + std::to_string(index) + " out of range");
    }
    return round_.participants[index];
}

Amount LotteryEngine::balance() const {
    return ledger_->balanceOf(address_);
}

void LotteryEngine::emit(const LotteryEvent& event) {
    log_.append(event);
    notify(event);
}

void LotteryEngine::notify(const LotteryEvent& event) const noexcept {
    if (onEvent_) {
        onEvent_(event);
    }
}

} // namespace lk
