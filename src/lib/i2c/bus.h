#pragma once
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include <cstdint>
#include <optional>

namespace i2c {

// 7-bit peripheral address, without the r/w bit
using PeripheralAddress = uint8_t;

constexpr PeripheralAddress kMaxPeripheralAddress = 0x7F;

// Blocking two-wire bus master. Implementations report every transport failure
// (NACK, timeout, arbitration loss) as an error of kind `Error::BusError`.
class Bus {
public:
  virtual ~Bus() = default;

  // writes `out`, then reads `in.size()` bytes without releasing the bus
  [[nodiscard]] virtual std::optional<Error> write_read(PeripheralAddress addr, DataView out, MutableDataView in) = 0;

  // writes `data` in a single transaction
  [[nodiscard]] virtual std::optional<Error> write(PeripheralAddress addr, DataView data) = 0;
};

} // namespace i2c
