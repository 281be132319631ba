#include "transaction.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include "lib/mb85rc/address/address.h"
#include <cstddef>
#include <expected>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace mb85rc {

namespace {

Word prefix_to_address(AddressPrefix prefix) {
  return static_cast<Word>((prefix[0] << 8) | prefix[1]);
}

} // namespace

std::expected<size_t, Error> read_transaction(i2c::Bus& bus, i2c::PeripheralAddress peripheral, AddressPrefix prefix,
                                              MutableDataView data) {
  if (auto err = bus.write_read(peripheral, DataView{prefix}, data)) {
    return std::unexpected{Error{Error::BusError,
                                 fmt::format("read from {:#04x} address: {:04x} size: {:x}: {}", peripheral,
                                             prefix_to_address(prefix), data.size(), err->what())}};
  }
  spdlog::trace("read {:#04x} address: {:04x} data: {}", peripheral, prefix_to_address(prefix), DataView{data});
  return data.size();
}

std::expected<size_t, Error> write_transaction(i2c::Bus& bus, i2c::PeripheralAddress peripheral, AddressPrefix prefix,
                                               DataView data) {
  std::vector<Byte> frame;
  frame.reserve(prefix.size() + data.size());
  frame.insert(frame.end(), prefix.begin(), prefix.end());
  frame.insert(frame.end(), data.begin(), data.end());

  spdlog::trace("write {:#04x} frame: {}", peripheral, DataView{frame});
  if (auto err = bus.write(peripheral, DataView{frame})) {
    return std::unexpected{Error{Error::BusError,
                                 fmt::format("write to {:#04x} address: {:04x} size: {:x}: {}", peripheral,
                                             prefix_to_address(prefix), data.size(), err->what())}};
  }
  return data.size();
}

} // namespace mb85rc
