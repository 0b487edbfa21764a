#include "vrf_oracle.hpp"

#include "picosha2.h"

#include <array>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lk {

namespace {

constexpr const char* kVrfDomainTag = "lottery-keeper:vrf:v1";

std::string buildDeploymentScope(const std::string& deploymentId, const std::string& chainId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for VRF domain separation");
    }
    if (chainId.empty()) {
        return deploymentId;
    }
    return deploymentId + "|" + chainId;
}

RandomWord hashToWord(const std::string& input) {
    std::array<std::uint8_t, 32> hash{};
    picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());

    RandomWord value = 0;
    for (std::uint8_t byte : hash) {
        value <<= 8;
        value += byte;
    }
    return value;
}

} // namespace

VrfRandomnessOracle::VrfRandomnessOracle(Config cfg, const VrfKeyPair& keys)
    : config_(std::move(cfg))
    , prover_(keys.secretKeyHex, keys.publicKeyHex)
    , nextRequestId_(1) {
    if (config_.address.empty()) {
        throw std::invalid_argument("oracle address must not be empty");
    }
    if (config_.keyHash.empty()) {
        throw std::invalid_argument("oracle keyHash must not be empty");
    }
    if (config_.minimumRequestConfirmations < 1) {
        throw std::invalid_argument("minimumRequestConfirmations must be at least 1");
    }
    if (config_.maxNumWords < 1) {
        throw std::invalid_argument("maxNumWords must be at least 1");
    }
    if (config_.maxRecordedFulfillments < 1) {
        throw std::invalid_argument("maxRecordedFulfillments must be at least 1");
    }
    // Fails early on an unusable scope rather than at the first request.
    buildDeploymentScope(config_.deploymentId, config_.chainId);
}

std::string VrfRandomnessOracle::buildAlpha(const std::string& deploymentId,
                                            const std::string& chainId,
                                            const std::string& keyHash,
                                            std::uint64_t subscriptionId,
                                            RequestId requestId) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << buildDeploymentScope(deploymentId, chainId) << "|" << keyHash
        << "|" << subscriptionId << "|" << requestId;
    return oss.str();
}

std::vector<RandomWord> VrfRandomnessOracle::expandRandomWords(const std::string& vrfOutputHex,
                                                               std::uint32_t numWords) {
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        words.push_back(hashToWord(vrfOutputHex + ":" + std::to_string(i)));
    }
    return words;
}

RequestId VrfRandomnessOracle::requestRandomWords(const RandomWordsRequest& request,
                                                  RandomnessConsumer& consumer) {
    if (request.keyHash != config_.keyHash) {
        throw OracleError("unknown key hash " + request.keyHash);
    }
    if (request.requestConfirmations < config_.minimumRequestConfirmations) {
        std::ostringstream oss;
        oss << "request confirmations " << request.requestConfirmations << " below minimum "
            << config_.minimumRequestConfirmations;
        throw OracleError(oss.str());
    }
    if (request.numWords < 1 || request.numWords > config_.maxNumWords) {
        std::ostringstream oss;
        oss << "numWords " << request.numWords << " outside [1, " << config_.maxNumWords << "]";
        throw OracleError(oss.str());
    }
    if (request.callbackGasLimit > config_.maxCallbackGasLimit) {
        std::ostringstream oss;
        oss << "callback gas limit " << request.callbackGasLimit << " exceeds "
            << config_.maxCallbackGasLimit;
        throw OracleError(oss.str());
    }

    RequestId id = nextRequestId_++;
    std::string alpha = buildAlpha(
        config_.deploymentId, config_.chainId, request.keyHash, request.subscriptionId, id);
    pending_.emplace(id, PendingRequest{ request, &consumer, std::move(alpha) });
    return id;
}

bool VrfRandomnessOracle::isPending(RequestId requestId) const {
    return pending_.count(requestId) != 0;
}

std::optional<FulfillmentProof> VrfRandomnessOracle::fulfillment(RequestId requestId) const {
    auto it = fulfilled_.find(requestId);
    if (it == fulfilled_.end()) {
        return std::nullopt;
    }
    return it->second;
}

VrfRandomnessOracle::PendingRequest VrfRandomnessOracle::takePending(RequestId requestId) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw OracleError("nonexistent request " + std::to_string(requestId));
    }
    PendingRequest pending = std::move(it->second);
    pending_.erase(it);
    return pending;
}

FulfillmentProof VrfRandomnessOracle::fulfill(RequestId requestId) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw OracleError("nonexistent request " + std::to_string(requestId));
    }

    // Prove before dequeuing so a prover failure leaves the request retryable.
    VrfProof vrf = prover_.prove(it->second.alpha);
    PendingRequest pending = takePending(requestId);

    FulfillmentProof proof;
    proof.requestId = requestId;
    proof.alpha = pending.alpha;
    proof.vrfProofHex = vrf.proofHex;
    proof.vrfOutputHex = vrf.outputHex;
    proof.randomWords = expandRandomWords(vrf.outputHex, pending.request.numWords);
    return deliver(std::move(pending), std::move(proof));
}

FulfillmentProof VrfRandomnessOracle::fulfillWithOverride(RequestId requestId,
                                                          std::vector<RandomWord> words) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw OracleError("nonexistent request " + std::to_string(requestId));
    }
    if (words.size() != it->second.request.numWords) {
        throw OracleError("override must supply exactly numWords random words");
    }

    PendingRequest pending = takePending(requestId);
    FulfillmentProof proof;
    proof.requestId = requestId;
    proof.alpha = pending.alpha;
    proof.randomWords = std::move(words);
    proof.overridden = true;
    return deliver(std::move(pending), std::move(proof));
}

FulfillmentProof VrfRandomnessOracle::deliver(PendingRequest pending, FulfillmentProof proof) {
    fulfilled_[proof.requestId] = proof;
    while (fulfilled_.size() > config_.maxRecordedFulfillments) {
        fulfilled_.erase(fulfilled_.begin());
    }
    pending.consumer->rawFulfillRandomWords(config_.address, proof.requestId, proof.randomWords);
    return proof;
}

bool VrfRandomnessOracle::verifyFulfillment(const FulfillmentProof& proof,
                                            const std::string& publicKeyHex) {
    if (proof.overridden) {
        return false;
    }
    if (!verifyVrf(proof.vrfProofHex, proof.vrfOutputHex, publicKeyHex, proof.alpha)) {
        return false;
    }
    auto expected =
        expandRandomWords(proof.vrfOutputHex, static_cast<std::uint32_t>(proof.randomWords.size()));
    return expected == proof.randomWords;
}

} // namespace lk
