#include "builder.h"
#include "fram.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include "lib/mb85rc/identify/identify.h"
#include <bit>
#include <expected>
#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

namespace mb85rc {

Builder& Builder::with_address(i2c::PeripheralAddress address) & {
  address_ = address;
  return *this;
}

Builder&& Builder::with_address(i2c::PeripheralAddress address) && {
  return std::move(with_address(address));
}

Builder& Builder::with_size(Long capacity) & {
  capacity_ = capacity;
  return *this;
}

Builder&& Builder::with_size(Long capacity) && {
  return std::move(with_size(capacity));
}

std::expected<Fram, Error> Builder::connect(std::unique_ptr<i2c::Bus> bus) && {
  if (!bus) {
    return std::unexpected{Error{Error::InvalidArgument, "no bus to connect to"}};
  }
  if (address_ > i2c::kMaxPeripheralAddress) {
    return std::unexpected{
        Error{Error::InvalidArgument, fmt::format("peripheral address {:#04x} is wider than 7 bits", address_)}};
  }

  Long capacity = 0;
  if (capacity_) {
    capacity = *capacity_;
    if (capacity == 0 || capacity > kMaxCapacity || !std::has_single_bit(capacity)) {
      return std::unexpected{Error{
          Error::InvalidArgument,
          fmt::format("capacity {} is not a power of two between 1 and {} bytes", capacity, kMaxCapacity)}};
    }
  } else {
    auto id = identify(*bus, address_);
    if (!id) {
      spdlog::error("auto-detection failed: {}", id.error().what());
      return std::unexpected{std::move(id.error())};
    }
    capacity = id->capacity_bytes();
  }

  spdlog::info("connected FRAM at {:#04x} capacity: {} bytes", address_, capacity);
  return Fram{{}, std::move(bus), address_, capacity};
}

} // namespace mb85rc
