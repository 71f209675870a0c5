// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "presence/process_context.hpp"
#include <string>

namespace lanpeer {
namespace presence {

/**
 * PeerController - start/stop contract for embedding hosts
 *
 * Start() validates the identifier, makes sure the shared context and
 * coordinator exist, and posts a session without waiting for it. Several
 * starts run several sessions side by side; one Stop() ends all of them.
 *
 * Nothing a session does in the background is reported back through
 * Start() or Stop().
 */
class PeerController {
public:
  explicit PeerController(ProcessContext &context) : context_(context) {}

  /**
   * Start a session for a caller-owned C string. Returns false (and logs a
   * warning) for a null pointer or bytes that are not valid UTF-8; in that
   * case nothing is created. Throws whatever EnsureContext() throws.
   */
  bool Start(const char *identifier);

  /**
   * Start a session for an already validated identifier. Returns true once
   * the session is posted. Throws std::system_error if the worker threads
   * cannot be started and std::runtime_error after ProcessContext::Shutdown().
   */
  bool Start(const std::string &identifier);

  // Broadcast shutdown to every running session. Idempotent.
  void Stop();

  ProcessContext &context() { return context_; }

private:
  ProcessContext &context_;
};

} // namespace presence
} // namespace lanpeer
