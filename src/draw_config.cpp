#include "draw_config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lk {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool parseFlag(const char* name, const std::string& value) {
    if (value == "1" || value == "true") {
        return true;
    }
    if (value == "0" || value == "false") {
        return false;
    }
    throw std::invalid_argument(std::string(name) + " must be one of 1, 0, true, false");
}

} // namespace

std::uint64_t parseUnsignedField(const char* name, const std::string& value, std::uint64_t max) {
    if (value.empty()) {
        throw std::invalid_argument(std::string(name) + " must not be empty");
    }
    for (char ch : value) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                        value + "\"");
        }
    }
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + " is out of range");
    }
    if (parsed > max) {
        throw std::invalid_argument(std::string(name) + " is out of range");
    }
    return parsed;
}

void DrawConfig::validate() const {
    if (oracle.coordinator.empty()) {
        throw std::invalid_argument("oracle.coordinator must not be empty");
    }
    if (oracle.keyHash.empty()) {
        throw std::invalid_argument("oracle.keyHash must not be empty");
    }
    if (oracle.requestConfirmations < 1) {
        throw std::invalid_argument("oracle.requestConfirmations must be at least 1");
    }
    if (oracle.numWords < 1) {
        throw std::invalid_argument("oracle.numWords must be at least 1");
    }
    if (oracle.callbackGasLimit == 0) {
        throw std::invalid_argument("oracle.callbackGasLimit must be positive");
    }
}

DrawConfig loadDrawConfigFromEnv(DrawConfig defaults) {
    DrawConfig cfg = std::move(defaults);

    if (auto v = readEnv("LK_ENTRY_FEE")) {
        cfg.entryFee = parseUnsignedField("LK_ENTRY_FEE", *v, std::numeric_limits<Amount>::max());
    }
    if (auto v = readEnv("LK_INTERVAL")) {
        cfg.interval = parseUnsignedField("LK_INTERVAL", *v, std::numeric_limits<Timestamp>::max());
    }
    if (auto v = readEnv("LK_ORACLE_ADDRESS")) {
        cfg.oracle.coordinator = *v;
    }
    if (auto v = readEnv("LK_KEY_HASH")) {
        cfg.oracle.keyHash = *v;
    }
    if (auto v = readEnv("LK_SUBSCRIPTION_ID")) {
        cfg.oracle.subscriptionId =
            parseUnsignedField("LK_SUBSCRIPTION_ID", *v, std::numeric_limits<std::uint64_t>::max());
    }
    if (auto v = readEnv("LK_CALLBACK_GAS_LIMIT")) {
        cfg.oracle.callbackGasLimit = static_cast<std::uint32_t>(
            parseUnsignedField("LK_CALLBACK_GAS_LIMIT", *v, std::numeric_limits<std::uint32_t>::max()));
    }
    if (auto v = readEnv("LK_REQUEST_CONFIRMATIONS")) {
        cfg.oracle.requestConfirmations = static_cast<std::uint16_t>(parseUnsignedField(
            "LK_REQUEST_CONFIRMATIONS", *v, std::numeric_limits<std::uint16_t>::max()));
    }
    if (auto v = readEnv("LK_NATIVE_PAYMENT")) {
        cfg.oracle.nativePayment = parseFlag("LK_NATIVE_PAYMENT", *v);
    }

    cfg.validate();
    return cfg;
}

} // namespace lk
