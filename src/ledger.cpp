#include "ledger.hpp"

#include <chrono>
#include <limits>
#include <sstream>

namespace lk {

namespace {

void checkedAdd(Amount& target, Amount amount, const Address& account) {
    if (amount > std::numeric_limits<Amount>::max() - target) {
        throw std::overflow_error("balance overflow for account " + account);
    }
    target += amount;
}

} // namespace

Timestamp SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

void ManualClock::advance(Timestamp seconds) {
    if (seconds > std::numeric_limits<Timestamp>::max() - now_) {
        throw std::overflow_error("clock overflow");
    }
    now_ += seconds;
}

void Ledger::credit(const Address& account, Amount amount) {
    if (account.empty()) {
        throw std::invalid_argument("cannot credit an empty address");
    }
    checkedAdd(balances_[account], amount, account);
}

Amount Ledger::balanceOf(const Address& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

void Ledger::transfer(const Address& from, const Address& to, Amount amount) {
    if (to.empty()) {
        throw std::invalid_argument("cannot transfer to an empty address");
    }
    if (rejectsIncoming(to)) {
        throw TransferRejected("recipient " + to + " rejected the transfer");
    }

    Amount available = balanceOf(from);
    if (available < amount) {
        std::ostringstream oss;
        oss << "account " << from << " holds " << available << ", needs " << amount;
        throw InsufficientFunds(oss.str());
    }
    if (from == to || amount == 0) {
        return;
    }

    Amount receiving = balanceOf(to);
    checkedAdd(receiving, amount, to);
    balances_[from] = available - amount;
    balances_[to] = receiving;
}

void Ledger::setRejectsIncoming(const Address& account, bool rejects) {
    if (rejects) {
        rejecting_.insert(account);
    } else {
        rejecting_.erase(account);
    }
}

bool Ledger::rejectsIncoming(const Address& account) const {
    return rejecting_.count(account) != 0;
}

} // namespace lk
