// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

// Only the paths that never create the process-wide runtime are exercised
// here; a real start binds a multicast socket.

#include "ffi/peer_ffi.h"
#include "infra/log_capture.hpp"
#include "presence/process_context.hpp"
#include <catch2/catch_test_macros.hpp>

using lanpeer::presence::ProcessContext;
using lanpeer::test::LogCapture;

TEST_CASE("peer_start rejects a null identifier", "[presence][ffi]") {
  LogCapture capture;
  CHECK_FALSE(peer_start(nullptr));
  CHECK(capture.Contains("Cannot start peer: identifier is null"));
  CHECK_FALSE(ProcessContext::Global().has_context());
}

TEST_CASE("peer_start rejects invalid UTF-8", "[presence][ffi]") {
  LogCapture capture;
  CHECK_FALSE(peer_start("bad\xC3"));
  CHECK_FALSE(peer_start("\xFF\xFE"));
  CHECK(capture.Count("identifier is not valid UTF-8") == 2);
  CHECK_FALSE(ProcessContext::Global().has_context());
  CHECK(ProcessContext::Global().sessions_launched() == 0);
}

TEST_CASE("peer_stop before any start is harmless", "[presence][ffi]") {
  LogCapture capture;
  peer_stop();
  bob_stop();
  CHECK(capture.Count("Stopping peer...") == 2);
  CHECK(capture.Count("Peer was never started") == 2);
  CHECK(ProcessContext::Global().coordinator() == nullptr);
}
