// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "ffi/peer_ffi.h"
#include "presence/peer_controller.hpp"
#include "util/logging.hpp"
#include <exception>

namespace {

lanpeer::presence::PeerController &Controller() {
  static lanpeer::presence::PeerController controller(
      lanpeer::presence::ProcessContext::Global());
  return controller;
}

} // namespace

extern "C" bool peer_start(const char *identifier) {
  try {
    return Controller().Start(identifier);
  } catch (const std::exception &e) {
    LOG_CRITICAL("Failed to start peer: {}", e.what());
    return false;
  }
}

extern "C" void peer_stop(void) {
  try {
    Controller().Stop();
  } catch (const std::exception &e) {
    LOG_CRITICAL("Failed to stop peer: {}", e.what());
  }
}

extern "C" bool bob_start(void) { return peer_start("bob"); }

extern "C" void bob_stop(void) { peer_stop(); }
