#pragma once

#include "lottery_types.hpp"

#include <cstdint>
#include <string>

namespace lk {

// 1 native unit = 10^18 base units.
constexpr Amount kNativeUnit = 1'000'000'000'000'000'000ULL;

struct OracleParams {
    Address coordinator;
    std::string keyHash;
    std::uint64_t subscriptionId = 0;
    std::uint32_t callbackGasLimit = 500'000;
    std::uint16_t requestConfirmations = 3;
    std::uint32_t numWords = 1;
    bool nativePayment = false;
};

struct DrawConfig {
    Amount entryFee = kNativeUnit / 100;
    Timestamp interval = 30;
    OracleParams oracle{};

    // Throws std::invalid_argument naming the offending field.
    void validate() const;
};

// Decimal digits only, no sign or whitespace, at most `max`. Throws std::invalid_argument
// naming `name` otherwise.
std::uint64_t parseUnsignedField(const char* name, const std::string& value, std::uint64_t max);

// Reads LK_ENTRY_FEE, LK_INTERVAL, LK_ORACLE_ADDRESS, LK_KEY_HASH, LK_SUBSCRIPTION_ID,
// LK_CALLBACK_GAS_LIMIT, LK_REQUEST_CONFIRMATIONS and LK_NATIVE_PAYMENT over the defaults.
DrawConfig loadDrawConfigFromEnv(DrawConfig defaults);

} // namespace lk
