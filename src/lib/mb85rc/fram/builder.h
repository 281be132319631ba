#pragma once
#include "fram.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include <expected>
#include <memory>
#include <optional>

namespace mb85rc {

// Configuration for a `Fram` handle: peripheral address and, optionally, the
// capacity. Without a capacity `connect` asks the part for its device id.
class Builder {
public:
  Builder& with_address(i2c::PeripheralAddress address) &;
  Builder&& with_address(i2c::PeripheralAddress address) &&;
  Builder& with_size(Long capacity) &;
  Builder&& with_size(Long capacity) &&;

  // consumes the builder and takes ownership of `bus`, which is destroyed if
  // connecting fails
  [[nodiscard]] std::expected<Fram, Error> connect(std::unique_ptr<i2c::Bus> bus) &&;

private:
  i2c::PeripheralAddress address_{Fram::kDefaultAddress};
  std::optional<Long> capacity_;
};

} // namespace mb85rc
