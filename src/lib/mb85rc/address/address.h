#pragma once
#include "lib/common/memory/types.h"
#include <array>

namespace mb85rc {

// big-endian memory address, the first two bytes of every transaction
using AddressPrefix = std::array<Byte, 2>;

constexpr AddressPrefix encode_address(AddressType addr) {
  return {static_cast<Byte>(addr >> 8), static_cast<Byte>(addr & 0xFF)};
}

static_assert(encode_address(0x1234) == AddressPrefix{0x12, 0x34});
static_assert(encode_address(0x00FF) == AddressPrefix{0x00, 0xFF});

} // namespace mb85rc
