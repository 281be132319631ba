#pragma once
#include <bit>
#include <concepts>
#include <expected>
#include <optional>
#include <utility>

#include "lib/common/error/error.h"
#include "types.h"

class Device {
public:
  virtual ~Device() = default;

  // reads `data.size()` bytes from address `addr`
  [[nodiscard]] virtual std::optional<Error> read(AddressType addr, MutableDataView data) = 0;

  // writes `data.size()` bytes to address `addr`
  [[nodiscard]] virtual std::optional<Error> write(AddressType addr, DataView data) = 0;

  template<std::integral T>
  std::expected<T, Error> read(AddressType addr) {
    T data;
    if (auto err = read(addr, MutableDataView{reinterpret_cast<Byte*>(&data), sizeof(T)})) {
      return std::unexpected{std::move(*err)};
    }
    // the device stores integers big-endian
    if constexpr (std::endian::native == std::endian::little) {
      data = std::byteswap(data);
    }
    return data;
  }

  template<std::integral T>
  [[nodiscard]] std::optional<Error> write(AddressType addr, T value) {
    if constexpr (std::endian::native == std::endian::little) {
      value = std::byteswap(value);
    }
    return write(addr, DataView{reinterpret_cast<const Byte*>(&value), sizeof(T)});
  }
};
