#include "linux_bus.h"
#include "bus.h"
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include <array>
#include <cerrno>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <fmt/core.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

namespace i2c {

namespace {

// i2c-dev refuses I2C_RDWR messages longer than this
constexpr size_t kMaxMessageLength = 8192;

std::optional<Error> check_message(PeripheralAddress addr, size_t length) {
  if (addr > kMaxPeripheralAddress) {
    return Error{Error::InvalidArgument, fmt::format("peripheral address {:#04x} is wider than 7 bits", addr)};
  }
  if (length > kMaxMessageLength) {
    return Error{Error::InvalidArgument,
                 fmt::format("message of {} bytes exceeds i2c-dev limit of {}", length, kMaxMessageLength)};
  }
  return std::nullopt;
}

i2c_msg make_write_message(PeripheralAddress addr, DataView data) {
  // the kernel only reads from write buffers
  return i2c_msg{
      .addr = addr,
      .flags = 0,
      .len = static_cast<__u16>(data.size()),
      .buf = const_cast<__u8*>(data.data()),
  };
}

i2c_msg make_read_message(PeripheralAddress addr, MutableDataView data) {
  return i2c_msg{
      .addr = addr,
      .flags = I2C_M_RD,
      .len = static_cast<__u16>(data.size()),
      .buf = data.data(),
  };
}

} // namespace

std::expected<LinuxBus, Error> LinuxBus::open(std::string_view path) {
  std::string path_str{path};
  const int fd = ::open(path_str.c_str(), O_RDWR);
  if (fd < 0) {
    return std::unexpected{Error{Error::BusError, fmt::format("open {}: {}", path_str, std::strerror(errno))}};
  }
  spdlog::debug("opened i2c bus {} fd: {}", path_str, fd);
  return LinuxBus{std::move(path_str), fd};
}

LinuxBus::LinuxBus(std::string path, int fd) : path_{std::move(path)}, fd_{fd} {}

LinuxBus::LinuxBus(LinuxBus&& other) noexcept
    : path_{std::move(other.path_)}, fd_{std::exchange(other.fd_, -1)} {}

LinuxBus& LinuxBus::operator=(LinuxBus&& other) noexcept {
  if (this != &other) {
    close();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

LinuxBus::~LinuxBus() {
  close();
}

void LinuxBus::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    spdlog::debug("closed i2c bus {}", path_);
    fd_ = -1;
  }
}

std::optional<Error> LinuxBus::write_read(PeripheralAddress addr, DataView out, MutableDataView in) {
  if (auto err = check_message(addr, out.size())) {
    return err;
  }
  if (auto err = check_message(addr, in.size())) {
    return err;
  }

  std::array<i2c_msg, 2> messages{make_write_message(addr, out), make_read_message(addr, in)};
  i2c_rdwr_ioctl_data transfer{
      .msgs = messages.data(),
      .nmsgs = static_cast<__u32>(messages.size()),
  };
  if (::ioctl(fd_, I2C_RDWR, &transfer) < 0) {
    return Error{Error::BusError, fmt::format("{}: write-read at {:#04x} (out: {} in: {}): {}", path_, addr,
                                              out.size(), in.size(), std::strerror(errno))};
  }
  return std::nullopt;
}

std::optional<Error> LinuxBus::write(PeripheralAddress addr, DataView data) {
  if (auto err = check_message(addr, data.size())) {
    return err;
  }

  auto message = make_write_message(addr, data);
  i2c_rdwr_ioctl_data transfer{
      .msgs = &message,
      .nmsgs = 1,
  };
  if (::ioctl(fd_, I2C_RDWR, &transfer) < 0) {
    return Error{Error::BusError,
                 fmt::format("{}: write at {:#04x} (size: {}): {}", path_, addr, data.size(), std::strerror(errno))};
  }
  return std::nullopt;
}

} // namespace i2c
