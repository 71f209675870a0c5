// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace lanpeer {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Lanpeer Developers";

inline std::string GetFullVersionString() {
  return "lanpeer version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner for the desktop runner
inline std::string GetStartupBanner(const std::string &identifier) {
  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner += "  lanpeer " + GetVersionString() + "\n";
  banner += "  local network presence\n";
  banner += colors::RESET;
  banner += "  identity: " + identifier + "\n";
  banner += "  " + GetCopyrightString() + "\n\n";
  return banner;
}

} // namespace lanpeer
