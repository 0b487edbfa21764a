#include "draw_config.hpp"
#include "vrf.hpp"
#include "vrf_oracle.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: audit_draw <publicKeyHex> <vrfProofHex> <vrfOutputHex> <alpha> "
                     "<participantCount> [numWords]\n";
        return 1;
    }

    std::string publicKey = argv[1];
    std::string vrfProof = argv[2];
    std::string vrfOutput = argv[3];
    std::string alpha = argv[4];
    std::uint64_t participantCount = 0;
    std::uint32_t numWords = 1;
    try {
        participantCount = lk::parseUnsignedField(
            "participantCount", argv[5], std::numeric_limits<std::uint64_t>::max());
        if (argc > 6) {
            numWords = static_cast<std::uint32_t>(lk::parseUnsignedField(
                "numWords", argv[6], std::numeric_limits<std::uint32_t>::max()));
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    if (participantCount == 0 || numWords == 0) {
        std::cerr << "participantCount and numWords must be positive\n";
        return 1;
    }

    bool ok = lk::verifyVrf(vrfProof, vrfOutput, publicKey, alpha);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    auto words = lk::VrfRandomnessOracle::expandRandomWords(vrfOutput, numWords);
    for (std::size_t i = 0; i < words.size(); ++i) {
        std::cout << "Random word " << i << ": " << words[i] << '\n';
    }
    lk::RandomWord index = words.front() % lk::RandomWord(participantCount);
    std::cout << "Winner index: " << index << " of " << participantCount << '\n';
    return 0;
}
