#include "event_log.hpp"

#include "picosha2.h"

#include <sstream>
#include <utility>
#include <vector>

namespace lk {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string hashPair(const std::string& left, const std::string& right) {
    return hashBytes(left + right);
}

} // namespace

const char* toString(LotteryEventKind kind) {
    switch (kind) {
    case LotteryEventKind::ENTERED:
        return "entered";
    case LotteryEventKind::DRAW_REQUESTED:
        return "draw_requested";
    case LotteryEventKind::WINNER_PICKED:
        return "winner_picked";
    }
    return "unknown";
}

std::string encodeEvent(const LotteryEvent& event) {
    std::ostringstream oss;
    oss << toString(event.kind) << '|' << event.participant.size() << ':' << event.participant
        << '|' << event.requestId << '|' << event.amount << '|' << event.timestamp;
    return oss.str();
}

std::string EventLog::hashEvent(const LotteryEvent& event) {
    return hashBytes(encodeEvent(event));
}

void EventLog::append(const LotteryEvent& event) {
    leaves_.push_back(hashEvent(event));
    events_.push_back(event);
}

std::string EventLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;

    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            if (i == index || i + 1 == index) {
                proof.push_back(i == index ? right : left);
            }
            next.push_back(hashPair(left, right));
        }

        index /= 2;
        layer = std::move(next);
    }

    return proof;
}

bool verifyMerkleProof(const std::string& leafHash,
                       std::size_t leafIndex,
                       std::size_t leafCount,
                       const std::vector<std::string>& proof,
                       const std::string& root) {
    if (leafIndex >= leafCount) {
        return false;
    }

    std::string current = leafHash;
    std::size_t index = leafIndex;
    std::size_t count = leafCount;
    for (const auto& sibling : proof) {
        if (count <= 1) {
            return false;
        }
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
        count = (count + 1) / 2;
    }
    return count == 1 && current == root;
}

} // namespace lk
