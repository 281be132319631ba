#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/linux_bus.h"
#include "lib/mb85rc/fram/builder.h"
#include "lib/mb85rc/fram/fram.h"
#include "spdlog/common.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// Writes random data of every power-of-two size to a real chip and reads it back.
//
// usage: fram_test [device] [address] [size]
//   device   i2c-dev node, default /dev/i2c-1 (the main bus on a Raspberry Pi)
//   address  7-bit peripheral address, default 0x50
//   size     capacity in bytes, detected from the device id when omitted
//
// FRAM_LOG_LEVEL selects the spdlog level (trace, debug, info, ...).

namespace mb85rc {

namespace {

using RandomBytesEngine = std::independent_bits_engine<std::default_random_engine, 8, Byte>;

// i2c-dev caps a message at 8192 bytes, the address prefix included
constexpr size_t kMaxTestSize = 4096;

// filler that makes a short read visible
constexpr Byte kFillerByte = 0xCD;

std::optional<unsigned long> parse_number(std::string_view str) {
  int base = 10;
  if (str.starts_with("0x") || str.starts_with("0X")) {
    str.remove_prefix(2);
    base = 16;
  }
  unsigned long value = 0;
  const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, base);
  if (ec != std::errc{} || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

bool test_sized(Fram& fram, RandomBytesEngine& engine, size_t size, Long at) {
  std::vector<Byte> random_data(size);
  std::generate(random_data.begin(), random_data.end(), std::ref(engine));

  if (auto pos = fram.seek(Fram::Whence::Start, at); !pos) {
    spdlog::error("test write (array of {}) ({} to {}): FAIL (seek): {}", size, at, at + size, pos.error().what());
    return false;
  }
  if (auto written = fram.stream_write(DataView{random_data}); !written) {
    spdlog::error("test write (array of {}) ({} to {}): FAIL (write): {}", size, at, at + size,
                  written.error().what());
    return false;
  }
  spdlog::info("test write (array of {}) ({} to {}): OK", size, at, at + size);

  std::vector<Byte> read_back(size, kFillerByte);
  if (auto pos = fram.seek(Fram::Whence::Start, at); !pos) {
    spdlog::error("test read: FAIL (seek): {}", pos.error().what());
    return false;
  }
  if (auto read = fram.stream_read(MutableDataView{read_back}); !read) {
    spdlog::error("test read: FAIL (read): {}", read.error().what());
    return false;
  }
  if (read_back != random_data) {
    const auto mismatch = std::mismatch(read_back.begin(), read_back.end(), random_data.begin());
    const auto offset = mismatch.first - read_back.begin();
    spdlog::error("test read: FAIL (compare) first difference at {}: read {:02x} wrote {:02x}", at + offset,
                  *mismatch.first, *mismatch.second);
    return false;
  }
  spdlog::info("test read: OK");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::info);
  if (const char* level = std::getenv("FRAM_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(level));
  }

  if (argc > 4) {
    spdlog::error("usage: {} [device] [address] [size]", argv[0]);
    return 2;
  }
  const auto device_path = std::string_view{argc > 1 ? argv[1] : "/dev/i2c-1"};

  Builder builder;
  if (argc > 2) {
    const auto address = parse_number(argv[2]);
    if (!address || *address > i2c::kMaxPeripheralAddress) {
      spdlog::error("invalid peripheral address: {}", argv[2]);
      return 2;
    }
    builder.with_address(static_cast<i2c::PeripheralAddress>(*address));
  }
  if (argc > 3) {
    const auto size = parse_number(argv[3]);
    if (!size || *size > kMaxCapacity) {
      spdlog::error("invalid size: {}", argv[3]);
      return 2;
    }
    builder.with_size(static_cast<Long>(*size));
  }

  auto bus = i2c::LinuxBus::open(device_path);
  if (!bus) {
    spdlog::error("{}", bus.error().what());
    return 1;
  }
  auto fram = std::move(builder).connect(std::make_unique<i2c::LinuxBus>(std::move(*bus)));
  if (!fram) {
    spdlog::error("connect failed: {}", fram.error().what());
    return 1;
  }
  spdlog::info("FRAM capacity: {}", fram->capacity());

  RandomBytesEngine engine{std::default_random_engine{std::random_device{}()}};
  int passed = 0;
  int failed = 0;
  for (size_t size = 1; size <= fram->capacity() && size <= kMaxTestSize; size <<= 1) {
    if (test_sized(*fram, engine, size, 0)) {
      ++passed;
    } else {
      ++failed;
    }
  }

  spdlog::info("PASSED TESTS: {}", passed);
  spdlog::info("FAILED TESTS: {}", failed);
  return failed == 0 ? 0 : 1;
}

} // namespace mb85rc

int main(int argc, char** argv) {
  return mb85rc::main(argc, argv);
}
