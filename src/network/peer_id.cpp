// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/peer_id.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <mutex>
#include <random>

namespace lanpeer {
namespace network {

PeerId PeerId::Random() {
  // static random_device: some platforms open /dev/urandom on every construction
  static std::random_device rd;
  static std::mutex rng_mutex;
  static std::mt19937_64 gen(rd());

  std::array<uint8_t, SIZE> bytes;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    for (size_t i = 0; i < SIZE; i += 8) {
      uint64_t word = gen();
      for (size_t k = 0; k < 8; ++k) {
        bytes[i + k] = static_cast<uint8_t>(word >> (8 * k));
      }
    }
  }
  return PeerId(bytes);
}

std::optional<PeerId> PeerId::FromHex(std::string_view hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }
  auto decoded = util::ParseHex(hex);
  if (!decoded) {
    return std::nullopt;
  }
  std::array<uint8_t, SIZE> bytes;
  std::copy(decoded->begin(), decoded->end(), bytes.begin());
  return PeerId(bytes);
}

std::string PeerId::ToString() const {
  return util::ToHex(bytes_.data(), bytes_.size());
}

std::string PeerId::ShortString() const {
  return util::ToHex(bytes_.data(), 5);
}

bool PeerId::IsNull() const {
  return std::all_of(bytes_.begin(), bytes_.end(),
                     [](uint8_t b) { return b == 0; });
}

} // namespace network
} // namespace lanpeer
