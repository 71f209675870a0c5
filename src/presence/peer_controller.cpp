// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/peer_controller.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <cstring>

namespace lanpeer {
namespace presence {

bool PeerController::Start(const char *identifier) {
  if (identifier == nullptr) {
    LOG_PEER_WARN("Cannot start peer: identifier is null");
    return false;
  }

  std::string_view text(identifier, std::strlen(identifier));
  if (!util::IsValidUtf8(text)) {
    LOG_PEER_WARN("Cannot start peer: identifier is not valid UTF-8");
    return false;
  }

  return Start(std::string(text));
}

bool PeerController::Start(const std::string &identifier) {
  context_.EnsureContext();
  ShutdownCoordinatorPtr coordinator = context_.EnsureCoordinator();

  context_.LaunchSession(identifier, coordinator->Subscribe());
  return true;
}

void PeerController::Stop() {
  LOG_PEER_INFO("Stopping peer...");

  ShutdownCoordinatorPtr coordinator = context_.coordinator();
  if (!coordinator) {
    LOG_PEER_WARN("Peer was never started");
    return;
  }

  const size_t signalled = coordinator->Send();
  LOG_PEER_DEBUG("Shutdown signal delivered to {} subscriber(s)", signalled);
  LOG_PEER_INFO("Shutdown signal sent");
}

} // namespace presence
} // namespace lanpeer
