// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/discovery.hpp"
#include "util/string_parsing.hpp"

namespace lanpeer {
namespace network {

std::optional<UserData> UserData::Parse(std::string_view text,
                                        std::string *error) {
  if (text.size() > MAX_LENGTH) {
    if (error) {
      *error = "user data is " + std::to_string(text.size()) +
               " bytes, maximum is " + std::to_string(MAX_LENGTH);
    }
    return std::nullopt;
  }
  if (!util::IsValidUtf8(text)) {
    if (error) {
      *error = "user data is not valid UTF-8";
    }
    return std::nullopt;
  }
  return UserData(std::string(text));
}

} // namespace network
} // namespace lanpeer
