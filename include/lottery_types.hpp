#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace lk {

using Address = std::string;
// Smallest indivisible unit of the native currency.
using Amount = std::uint64_t;
// Seconds.
using Timestamp = std::uint64_t;
using RequestId = std::uint64_t;
using RandomWord = boost::multiprecision::uint256_t;

enum class LotteryState {
    OPEN,
    DRAWING
};

inline const char* toString(LotteryState state) {
    switch (state) {
    case LotteryState::OPEN:
        return "OPEN";
    case LotteryState::DRAWING:
        return "DRAWING";
    }
    return "UNKNOWN";
}

} // namespace lk
