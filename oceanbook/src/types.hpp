#pragma once

#include <cstdint>

namespace oceanbook {

// Strong typedefs for domain clarity
using OrderId = uint64_t;   // Unique order identifier (lower = submitted earlier)
using MemberId = uint64_t;  // Owning account
using Timestamp = uint64_t; // Nanoseconds since epoch

// Side of the order
enum class Side : uint8_t { Buy = 1, Sell = 2 };

[[nodiscard]] inline const char* toString(Side side) { return side == Side::Buy ? "buy" : "sell"; }

[[nodiscard]] inline Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

} // namespace oceanbook
