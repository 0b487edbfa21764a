#pragma once

#include "randomness_oracle.hpp"
#include "vrf.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lk {

struct FulfillmentProof {
    RequestId requestId = 0;
    std::string alpha;
    std::string vrfProofHex;
    std::string vrfOutputHex;
    std::vector<RandomWord> randomWords;
    bool overridden = false;
};

// Local randomness coordinator backed by a libsodium VRF key. Requests queue until
// fulfill() is called; each request is delivered at most once.
class VrfRandomnessOracle : public RandomnessOracle {
public:
    struct Config {
        Address address;
        std::string keyHash;
        std::string deploymentId;
        std::string chainId;
        std::uint16_t minimumRequestConfirmations = 1;
        std::uint32_t maxNumWords = 500;
        std::uint32_t maxCallbackGasLimit = 2'500'000;
        // Oldest fulfillment records are dropped beyond this many.
        std::size_t maxRecordedFulfillments = 256;
    };

    VrfRandomnessOracle(Config cfg, const VrfKeyPair& keys);

    const Address& address() const override { return config_.address; }
    RequestId requestRandomWords(const RandomWordsRequest& request,
                                 RandomnessConsumer& consumer) override;

    FulfillmentProof fulfill(RequestId requestId);
    // Delivers caller-chosen words instead of VRF output. Test tooling only.
    FulfillmentProof fulfillWithOverride(RequestId requestId, std::vector<RandomWord> words);

    bool isPending(RequestId requestId) const;
    std::size_t pendingCount() const { return pending_.size(); }
    std::optional<FulfillmentProof> fulfillment(RequestId requestId) const;
    std::size_t recordedCount() const { return fulfilled_.size(); }
    const std::string& publicKey() const { return prover_.publicKey(); }
    const Config& config() const { return config_; }

    static std::string buildAlpha(const std::string& deploymentId,
                                  const std::string& chainId,
                                  const std::string& keyHash,
                                  std::uint64_t subscriptionId,
                                  RequestId requestId);
    static std::vector<RandomWord> expandRandomWords(const std::string& vrfOutputHex,
                                                     std::uint32_t numWords);
    static bool verifyFulfillment(const FulfillmentProof& proof, const std::string& publicKeyHex);

private:
    struct PendingRequest {
        RandomWordsRequest request;
        RandomnessConsumer* consumer;
        std::string alpha;
    };

    PendingRequest takePending(RequestId requestId);
    FulfillmentProof deliver(PendingRequest pending, FulfillmentProof proof);

    Config config_;
    VrfProver prover_;
    RequestId nextRequestId_;
    std::map<RequestId, PendingRequest> pending_;
    std::map<RequestId, FulfillmentProof> fulfilled_;
};

} // namespace lk
