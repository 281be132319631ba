#pragma once
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include <array>
#include <expected>

namespace mb85rc {

// reserved address answering the device id command for every part on the bus
constexpr i2c::PeripheralAddress kDeviceIdAddress = 0xF8 >> 1;

// largest part reachable with the 16-bit address prefix
constexpr Long kMaxCapacity = 1 << 16;

using DeviceIdBytes = std::array<Byte, 3>;

struct DeviceId {
  Word manufacturer_id;
  // capacity is 2^density KiB
  Byte density;
  Byte product_revision;

  Long capacity_bytes() const {
    return Long{1024} << density;
  }
};

DeviceId decode_device_id(DeviceIdBytes bytes);

// Queries the device id of the part at `peripheral`.
// Fails with `Error::IdentificationFailure` when the bus transaction fails or
// when the part is larger than the 16-bit address space.
std::expected<DeviceId, Error> identify(i2c::Bus& bus, i2c::PeripheralAddress peripheral);

} // namespace mb85rc
