#pragma once

#include "lottery_types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lk {

class LotteryError : public std::runtime_error {
public:
    explicit LotteryError(const std::string& what) : std::runtime_error(what) {}
};

class InsufficientPayment : public LotteryError {
public:
    InsufficientPayment(Amount paid, Amount required);

    Amount paid() const { return paid_; }
    Amount required() const { return required_; }

private:
    Amount paid_;
    Amount required_;
};

class RoundNotOpen : public LotteryError {
public:
    RoundNotOpen() : LotteryError("round is not open for entries") {}
};

// Carries the state that made the eligibility predicate fail.
class UpkeepNotNeeded : public LotteryError {
public:
    UpkeepNotNeeded(Amount balance, std::size_t participants, LotteryState state);

    Amount balance() const { return balance_; }
    std::size_t participants() const { return participants_; }
    LotteryState state() const { return state_; }

private:
    Amount balance_;
    std::size_t participants_;
    LotteryState state_;
};

// Raised after the round has already been reset; the pot stays in the holding account.
class PayoutFailed : public LotteryError {
public:
    PayoutFailed(Address winner, Amount amount, const std::string& reason);

    const Address& winner() const { return winner_; }
    Amount amount() const { return amount_; }

private:
    Address winner_;
    Amount amount_;
};

class OnlyOracleCanFulfill : public LotteryError {
public:
    OnlyOracleCanFulfill(Address have, Address want);

    const Address& have() const { return have_; }
    const Address& want() const { return want_; }

private:
    Address have_;
    Address want_;
};

class UnknownDrawRequest : public LotteryError {
public:
    explicit UnknownDrawRequest(RequestId requestId);

    RequestId requestId() const { return requestId_; }

private:
    RequestId requestId_;
};

} // namespace lk
