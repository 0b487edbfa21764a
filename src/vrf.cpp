#include "vrf.hpp"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <sodium.h>

namespace lk {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void requireSodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

void wipe(std::vector<unsigned char>& bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

const unsigned char* messageBytes(const std::string& message) {
    return reinterpret_cast<const unsigned char*>(message.data());
}

// Decodes `hex` and insists on exactly `expected` bytes; nullopt on any mismatch.
std::optional<std::vector<unsigned char>> decodeExact(const std::string& hex, std::size_t expected) {
    if (hex.size() != expected * 2) {
        return std::nullopt;
    }
    try {
        return hexToBytes(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

// Output hash of `proof` over `alpha`, or nullopt if the proof does not hold for `publicKey`.
std::optional<std::vector<unsigned char>> checkProof(const std::vector<unsigned char>& publicKey,
                                                     const std::vector<unsigned char>& proof,
                                                     const std::string& alpha) {
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_verify(output.data(), publicKey.data(), proof.data(), messageBytes(alpha),
                          alpha.size()) != 0) {
        return std::nullopt;
    }
    return output;
}

VrfKeyPair encodeKeyPair(const std::vector<unsigned char>& publicKey,
                         std::vector<unsigned char>& secretKey) {
    VrfKeyPair keys;
    keys.publicKeyHex = bytesToHex(publicKey.data(), publicKey.size());
    keys.secretKeyHex = bytesToHex(secretKey.data(), secretKey.size());
    wipe(secretKey);
    return keys;
}

} // namespace

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::string hex;
    hex.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        hex.push_back(kHexDigits[data[i] >> 4]);
        hex.push_back(kHexDigits[data[i] & 0x0f]);
    }
    return hex;
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (std::isxdigit(static_cast<unsigned char>(hex[i])) == 0 ||
            std::isxdigit(static_cast<unsigned char>(hex[i + 1])) == 0) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<unsigned char>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

VrfProver::VrfProver(std::string secretKeyHex, std::string publicKeyHex)
    : publicKeyHex_(std::move(publicKeyHex)) {
    requireSodium();

    secretKey_ = hexToBytes(secretKeyHex);
    sodium_memzero(&secretKeyHex[0], secretKeyHex.size());
    if (secretKey_.size() != crypto_vrf_SECRETKEYBYTES) {
        wipe(secretKey_);
        throw std::invalid_argument("VRF secret key length invalid");
    }

    publicKey_ = hexToBytes(publicKeyHex_);
    if (publicKey_.size() != crypto_vrf_PUBLICKEYBYTES) {
        wipe(secretKey_);
        throw std::invalid_argument("VRF public key length invalid");
    }
}

VrfProver::~VrfProver() {
    wipe(secretKey_);
}

VrfProof VrfProver::prove(const std::string& alpha) const {
    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(), secretKey_.data(), messageBytes(alpha), alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }

    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    // A proof that fails its own public key means the configured key pair is inconsistent.
    auto checked = checkProof(publicKey_, proof, alpha);
    if (!checked || *checked != output) {
        throw std::runtime_error("VRF proof does not verify with the oracle public key");
    }

    return VrfProof{ bytesToHex(proof.data(), proof.size()),
                     bytesToHex(output.data(), output.size()) };
}

bool verifyVrf(const std::string& vrfProofHex,
               const std::string& vrfOutputHex,
               const std::string& publicKeyHex,
               const std::string& alpha) {
    requireSodium();

    auto proof = decodeExact(vrfProofHex, crypto_vrf_PROOFBYTES);
    auto output = decodeExact(vrfOutputHex, crypto_vrf_OUTPUTBYTES);
    auto publicKey = decodeExact(publicKeyHex, crypto_vrf_PUBLICKEYBYTES);
    if (!proof || !output || !publicKey) {
        return false;
    }

    auto recomputed = checkProof(*publicKey, *proof, alpha);
    return recomputed && *recomputed == *output;
}

VrfKeyPair generateVrfKeypair() {
    requireSodium();

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair(publicKey.data(), secretKey.data()) != 0) {
        wipe(secretKey);
        throw std::runtime_error("VRF key generation failed");
    }
    return encodeKeyPair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    requireSodium();

    auto seed = decodeExact(seedHex, crypto_vrf_SEEDBYTES);
    if (!seed) {
        throw std::invalid_argument("VRF seed must be " + std::to_string(crypto_vrf_SEEDBYTES) +
                                    " hex-encoded bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    int rc = crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed->data());
    wipe(*seed);
    if (rc != 0) {
        wipe(secretKey);
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    return encodeKeyPair(publicKey, secretKey);
}

} // namespace lk
