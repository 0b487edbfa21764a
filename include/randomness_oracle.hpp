#pragma once

#include "lottery_types.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lk {

struct RandomWordsRequest {
    std::string keyHash;
    std::uint64_t subscriptionId = 0;
    std::uint16_t requestConfirmations = 1;
    std::uint32_t callbackGasLimit = 0;
    std::uint32_t numWords = 1;
    bool nativePayment = false;
};

class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& what) : std::runtime_error(what) {}
};

// Receives exactly one callback per accepted request. Implementations must reject any
// caller other than the oracle they registered with.
class RandomnessConsumer {
public:
    virtual ~RandomnessConsumer() = default;
    virtual void rawFulfillRandomWords(const Address& caller,
                                       RequestId requestId,
                                       const std::vector<RandomWord>& randomWords) = 0;
};

// The consumer must outlive every request it submits. Fulfillment never happens from
// inside requestRandomWords.
class RandomnessOracle {
public:
    virtual ~RandomnessOracle() = default;
    virtual const Address& address() const = 0;
    virtual RequestId requestRandomWords(const RandomWordsRequest& request,
                                         RandomnessConsumer& consumer) = 0;
};

using OraclePtr = std::shared_ptr<RandomnessOracle>;

} // namespace lk
