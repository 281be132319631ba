#pragma once
#include "lib/common/error/error.h"
#include "lib/common/memory/types.h"
#include "lib/i2c/bus.h"
#include "lib/mb85rc/address/address.h"
#include <cstddef>
#include <expected>

namespace mb85rc {

// Sends the address prefix, then reads `data.size()` bytes in the same transaction.
// Returns the number of bytes read.
std::expected<size_t, Error> read_transaction(i2c::Bus& bus, i2c::PeripheralAddress peripheral, AddressPrefix prefix,
                                              MutableDataView data);

// Sends the address prefix followed by `data`; the chip auto-increments its
// address register across the payload. Returns the number of payload bytes written.
std::expected<size_t, Error> write_transaction(i2c::Bus& bus, i2c::PeripheralAddress peripheral, AddressPrefix prefix,
                                               DataView data);

} // namespace mb85rc
