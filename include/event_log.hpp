#pragma once

#include "lottery_types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace lk {

enum class LotteryEventKind {
    ENTERED,
    DRAW_REQUESTED,
    WINNER_PICKED
};

const char* toString(LotteryEventKind kind);

struct LotteryEvent {
    LotteryEventKind kind;
    Address participant;     // entrant or winner; empty for DRAW_REQUESTED
    RequestId requestId = 0; // DRAW_REQUESTED and WINNER_PICKED
    Amount amount = 0;       // payment for ENTERED, pot for WINNER_PICKED
    Timestamp timestamp = 0;
};

// Canonical encoding, one field per '|' separated slot.
std::string encodeEvent(const LotteryEvent& event);

using LotteryEventCallback = std::function<void(const LotteryEvent& event)>;

// Append-only notification stream with a Merkle commitment over the SHA-256 of each
// encoded event.
class EventLog {
public:
    void append(const LotteryEvent& event);

    const std::vector<LotteryEvent>& events() const { return events_; }
    const LotteryEvent& at(std::size_t index) const { return events_.at(index); }
    std::size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    std::string getLeaf(std::size_t index) const;
    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const LotteryEvent& event);

private:
    std::vector<LotteryEvent> events_;
    std::vector<std::string> leaves_;
};

bool verifyMerkleProof(const std::string& leafHash,
                       std::size_t leafIndex,
                       std::size_t leafCount,
                       const std::vector<std::string>& proof,
                       const std::string& root);

} // namespace lk
