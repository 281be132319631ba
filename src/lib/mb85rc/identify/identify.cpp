#include "identify.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include <array>
#include <expected>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

// reference: Fujitsu MB85RC256V datasheet, "Device ID Command"

namespace mb85rc {

DeviceId decode_device_id(DeviceIdBytes bytes) {
  return DeviceId{
      .manufacturer_id = static_cast<Word>((bytes[0] << 4) | ((bytes[1] >> 4) & 0xF)),
      .density = static_cast<Byte>(bytes[1] & 0xF),
      .product_revision = bytes[2],
  };
}

std::expected<DeviceId, Error> identify(i2c::Bus& bus, i2c::PeripheralAddress peripheral) {
  // command byte is the target address shifted into the upper seven bits
  const std::array<Byte, 1> command{static_cast<Byte>(peripheral << 1)};
  DeviceIdBytes response{};

  if (auto err = bus.write_read(kDeviceIdAddress, DataView{command}, MutableDataView{response})) {
    return std::unexpected{Error{Error::IdentificationFailure,
                                 fmt::format("device id query for {:#04x} failed: {}", peripheral, err->what())}};
  }
  spdlog::trace("device id response for {:#04x}: {}", peripheral, DataView{response});

  const auto id = decode_device_id(response);
  if (id.capacity_bytes() > kMaxCapacity) {
    return std::unexpected{Error{Error::IdentificationFailure,
                                 fmt::format("part at {:#04x} has {} bytes (density {:x}), only {} are addressable",
                                             peripheral, id.capacity_bytes(), id.density, kMaxCapacity)}};
  }

  spdlog::info("identified {:#04x}: manufacturer: {:03x} density: {:x} revision: {:02x} capacity: {} bytes",
               peripheral, id.manufacturer_id, id.density, id.product_revision, id.capacity_bytes());
  return id;
}

} // namespace mb85rc
