#pragma once
#include "lib/common/error/error.h"
#include "lib/common/memory/device.h"
#include "lib/common/memory/types.h"
#include "lib/common/util/passkey.h"
#include "lib/i2c/bus.h"
#include "lib/mb85rc/identify/identify.h"
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>

namespace mb85rc {

class Builder;

// MB85RC-series I2C FRAM exposed as a seekable byte store.
//
// Direct `read`/`write` take an explicit address and leave the stream position
// alone; `seek`/`stream_read`/`stream_write` work at the stream position and
// advance it by the bytes transferred. Every transfer is one bus transaction and
// is rejected with `Error::OutOfRange` before touching the bus if it would run
// past the last cell.
class Fram : public Device {
public:
  static constexpr i2c::PeripheralAddress kDefaultAddress = 0x50;

  enum class Whence {
    Start,
    Current,
    End,
  };

  Fram(Passkey<Builder>, std::unique_ptr<i2c::Bus> bus, i2c::PeripheralAddress address, Long capacity);

  // operations on a moved-from handle fail with InvalidArgument
  Fram(Fram&&) = default;
  Fram& operator=(Fram&&) = default;

  i2c::PeripheralAddress address() const {
    return address_;
  }
  Long capacity() const {
    return capacity_;
  }
  Long position() const {
    return position_;
  }

  using Device::read;
  using Device::write;

  std::optional<Error> read(AddressType addr, MutableDataView data) override;
  std::optional<Error> write(AddressType addr, DataView data) override;

  // moves the stream position, returns the new position
  [[nodiscard]] std::expected<Long, Error> seek(Whence whence, SignedLongLong offset);

  [[nodiscard]] std::expected<size_t, Error> stream_read(MutableDataView data);
  [[nodiscard]] std::expected<size_t, Error> stream_write(DataView data);

  // writes `value` to every cell, the stream position is kept
  [[nodiscard]] std::optional<Error> fill(Byte value);
  [[nodiscard]] std::optional<Error> erase();

  // queries the device id of the attached part
  [[nodiscard]] std::expected<DeviceId, Error> identify();

private:
  std::optional<Error> check_bus() const;
  std::optional<Error> check_range(Long addr, size_t size) const;

private:
  std::unique_ptr<i2c::Bus> bus_;
  i2c::PeripheralAddress address_;
  Long capacity_;
  Long position_{0};
};

} // namespace mb85rc
