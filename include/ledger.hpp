#pragma once

#include "lottery_types.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace lk {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Simulated time for tests and the interactive session.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void advance(Timestamp seconds);
    void set(Timestamp value) { now_ = value; }

private:
    Timestamp now_;
};

using ClockPtr = std::shared_ptr<Clock>;

class InsufficientFunds : public std::runtime_error {
public:
    explicit InsufficientFunds(const std::string& what) : std::runtime_error(what) {}
};

class TransferRejected : public std::runtime_error {
public:
    explicit TransferRejected(const std::string& what) : std::runtime_error(what) {}
};

// Native-currency balances of the hosting ledger.
class Ledger {
public:
    void credit(const Address& account, Amount amount);
    Amount balanceOf(const Address& account) const;

    // All-or-nothing: on failure no balance changes.
    void transfer(const Address& from, const Address& to, Amount amount);

    void setRejectsIncoming(const Address& account, bool rejects);
    bool rejectsIncoming(const Address& account) const;

private:
    std::unordered_map<Address, Amount> balances_;
    std::unordered_set<Address> rejecting_;
};

using LedgerPtr = std::shared_ptr<Ledger>;

} // namespace lk
