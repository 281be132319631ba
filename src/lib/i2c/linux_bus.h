#pragma once
#include "bus.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace i2c {

// Linux i2c-dev character device (/dev/i2c-N)
class LinuxBus : public Bus {
public:
  static std::expected<LinuxBus, Error> open(std::string_view path);

  LinuxBus(const LinuxBus&) = delete;
  LinuxBus& operator=(const LinuxBus&) = delete;
  LinuxBus(LinuxBus&& other) noexcept;
  LinuxBus& operator=(LinuxBus&& other) noexcept;
  ~LinuxBus() override;

  const std::string& path() const {
    return path_;
  }

  std::optional<Error> write_read(PeripheralAddress addr, DataView out, MutableDataView in) override;
  std::optional<Error> write(PeripheralAddress addr, DataView data) override;

private:
  LinuxBus(std::string path, int fd);

  void close();

private:
  std::string path_;
  int fd_{-1};
};

} // namespace i2c
