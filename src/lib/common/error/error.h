#pragma once
#include <string>
#include <utility>

class Error {
public:
  enum Kind {
    // no error
    Ok,

    // transport failure: NACK, timeout, arbitration loss
    BusError,

    // address or seek target outside of the device
    OutOfRange,

    // bad configuration or negative position
    InvalidArgument,

    // device id query failed or returned an unsupported part
    IdentificationFailure,
  };

  Error() = default;
  Error(Kind kind, std::string what): kind_{kind}, what_{std::move(what)}
  {}

  Kind kind() const {
    return kind_;
  }
  const std::string& what() const {
    return what_;
  }

private:
  Kind kind_{Ok};
  std::string what_;
};
