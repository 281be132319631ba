#include "fram.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include "lib/mb85rc/address/address.h"
#include "lib/mb85rc/identify/identify.h"
#include "lib/mb85rc/transaction/transaction.h"
#include "magic_enum/magic_enum.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <expected>
#include <fmt/core.h>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <utility>

namespace mb85rc {

namespace {

// bytes per write transaction while filling
constexpr size_t kFillChunkSize = 256;

} // namespace

Fram::Fram(Passkey<Builder>, std::unique_ptr<i2c::Bus> bus, i2c::PeripheralAddress address, Long capacity)
    : bus_{std::move(bus)}, address_{address}, capacity_{capacity} {}

std::optional<Error> Fram::check_bus() const {
  if (!bus_) {
    return Error{Error::InvalidArgument, "FRAM handle was moved from"};
  }
  return std::nullopt;
}

std::optional<Error> Fram::check_range(Long addr, size_t size) const {
  if (auto err = check_bus()) {
    return err;
  }
  if (addr + size > capacity_) {
    return Error{Error::OutOfRange,
                 fmt::format("access address: {:04x} size: {:x} exceeds capacity: {:x}", addr, size, capacity_)};
  }
  return std::nullopt;
}

std::optional<Error> Fram::read(AddressType addr, MutableDataView data) {
  if (data.empty()) {
    return std::nullopt;
  }
  if (auto err = check_range(addr, data.size())) {
    return err;
  }
  spdlog::debug("read address: {:04x} size: {:x}", addr, data.size());
  if (auto result = read_transaction(*bus_, address_, encode_address(addr), data); !result) {
    return std::move(result.error());
  }
  return std::nullopt;
}

std::optional<Error> Fram::write(AddressType addr, DataView data) {
  if (data.empty()) {
    return std::nullopt;
  }
  if (auto err = check_range(addr, data.size())) {
    return err;
  }
  spdlog::debug("write address: {:04x} size: {:x}", addr, data.size());
  if (auto result = write_transaction(*bus_, address_, encode_address(addr), data); !result) {
    return std::move(result.error());
  }
  return std::nullopt;
}

std::expected<Long, Error> Fram::seek(Whence whence, SignedLongLong offset) {
  SignedLongLong base = 0;
  switch (whence) {
  case Whence::Start:
    base = 0;
    break;
  case Whence::Current:
    base = position_;
    break;
  case Whence::End:
    base = capacity_;
    break;
  }

  // base is within [0, capacity], compare before adding so the sum cannot overflow
  if (offset < -base) {
    return std::unexpected{Error{Error::InvalidArgument, fmt::format("seek from {} by {} to a negative position",
                                                                     magic_enum::enum_name(whence), offset)}};
  }
  if (offset >= static_cast<SignedLongLong>(capacity_) - base) {
    return std::unexpected{Error{Error::OutOfRange, fmt::format("seek from {} by {} exceeds capacity: {:x}",
                                                                magic_enum::enum_name(whence), offset, capacity_)}};
  }

  const SignedLongLong target = base + offset;
  position_ = static_cast<Long>(target);
  spdlog::debug("seek from {} by {} position: {:04x}", magic_enum::enum_name(whence), offset, position_);
  return position_;
}

std::expected<size_t, Error> Fram::stream_read(MutableDataView data) {
  if (data.empty()) {
    return 0;
  }
  if (auto err = check_range(position_, data.size())) {
    return std::unexpected{std::move(*err)};
  }
  spdlog::debug("stream read position: {:04x} size: {:x}", position_, data.size());
  auto result = read_transaction(*bus_, address_, encode_address(static_cast<AddressType>(position_)), data);
  if (result) {
    position_ += static_cast<Long>(*result);
  }
  return result;
}

std::expected<size_t, Error> Fram::stream_write(DataView data) {
  if (data.empty()) {
    return 0;
  }
  if (auto err = check_range(position_, data.size())) {
    return std::unexpected{std::move(*err)};
  }
  spdlog::debug("stream write position: {:04x} size: {:x}", position_, data.size());
  auto result = write_transaction(*bus_, address_, encode_address(static_cast<AddressType>(position_)), data);
  if (result) {
    position_ += static_cast<Long>(*result);
  }
  return result;
}

std::optional<Error> Fram::fill(Byte value) {
  if (auto err = check_bus()) {
    return err;
  }
  spdlog::debug("fill capacity: {:x} value: {:02x}", capacity_, value);
  std::array<Byte, kFillChunkSize> chunk;
  chunk.fill(value);
  for (Long addr = 0; addr < capacity_; addr += kFillChunkSize) {
    const auto size = std::min<size_t>(kFillChunkSize, capacity_ - addr);
    const auto prefix = encode_address(static_cast<AddressType>(addr));
    if (auto result = write_transaction(*bus_, address_, prefix, DataView{chunk.data(), size}); !result) {
      return std::move(result.error());
    }
  }
  return std::nullopt;
}

std::optional<Error> Fram::erase() {
  return fill(0xFF);
}

std::expected<DeviceId, Error> Fram::identify() {
  if (auto err = check_bus()) {
    return std::unexpected{std::move(*err)};
  }
  return mb85rc::identify(*bus_, address_);
}

} // namespace mb85rc
