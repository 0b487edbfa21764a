#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lk {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

struct VrfProof {
    std::string proofHex;
    std::string outputHex;
};

// Holds a VRF secret key for the lifetime of an oracle; the key is wiped on destruction.
class VrfProver {
public:
    VrfProver(std::string secretKeyHex, std::string publicKeyHex);
    ~VrfProver();

    VrfProver(const VrfProver&) = delete;
    VrfProver& operator=(const VrfProver&) = delete;

    VrfProof prove(const std::string& alpha) const;
    const std::string& publicKey() const { return publicKeyHex_; }

private:
    std::vector<unsigned char> secretKey_;
    std::vector<unsigned char> publicKey_;
    std::string publicKeyHex_;
};

bool verifyVrf(const std::string& vrfProofHex,
               const std::string& vrfOutputHex,
               const std::string& publicKeyHex,
               const std::string& alpha);

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexToBytes(const std::string& hex);

} // namespace lk
