#pragma once

// only `T` can construct the key, so only `T` can call methods taking it
template<typename T>
class Passkey {
  friend T;
  Passkey() = default;
};
