// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lanpeer {
namespace network {

/**
 * PeerId - opaque identifier the discovery layer assigns to an endpoint
 *
 * 32 bytes, rendered as 64 lowercase hex characters. Value type; compared
 * byte-wise. Generated randomly per bound endpoint.
 */
class PeerId {
public:
  static constexpr size_t SIZE = 32;

  PeerId() { bytes_.fill(0); }
  explicit PeerId(const std::array<uint8_t, SIZE> &bytes) : bytes_(bytes) {}

  // Fresh random identifier
  static PeerId Random();

  // Parse 64 hex characters; std::nullopt on anything else
  static std::optional<PeerId> FromHex(std::string_view hex);

  std::string ToString() const;

  // First 10 hex characters, for compact log lines
  std::string ShortString() const;

  bool IsNull() const;

  const std::array<uint8_t, SIZE> &bytes() const { return bytes_; }

  friend bool operator==(const PeerId &a, const PeerId &b) {
    return a.bytes_ == b.bytes_;
  }
  friend bool operator!=(const PeerId &a, const PeerId &b) {
    return !(a == b);
  }
  friend bool operator<(const PeerId &a, const PeerId &b) {
    return a.bytes_ < b.bytes_;
  }

private:
  std::array<uint8_t, SIZE> bytes_;
};

} // namespace network
} // namespace lanpeer

namespace std {
template <> struct hash<lanpeer::network::PeerId> {
  size_t operator()(const lanpeer::network::PeerId &id) const noexcept {
    // Identifiers are random; the leading bytes are already well mixed
    size_t h = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i) {
      h = (h << 8) | id.bytes()[i];
    }
    return h;
  }
};
} // namespace std
