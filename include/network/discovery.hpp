// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_id.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lanpeer {
namespace network {

// Abstract discovery interface consumed by the presence core.
// Implementations:
// - MulticastDiscovery: UDP multicast beacons via boost::asio
// - SimulatedLan: in-memory LAN for testing (in test/)

/**
 * UserData - label attached to this endpoint's discovery records
 *
 * At most MAX_LENGTH bytes of valid UTF-8. Parse() is the only way to build
 * one, so every instance satisfies both limits.
 */
class UserData {
public:
  static constexpr size_t MAX_LENGTH = 245;

  // std::nullopt (and *error filled in) if text is too long or not UTF-8
  static std::optional<UserData> Parse(std::string_view text,
                                       std::string *error = nullptr);

  const std::string &str() const { return value_; }

  friend bool operator==(const UserData &a, const UserData &b) {
    return a.value_ == b.value_;
  }

private:
  explicit UserData(std::string value) : value_(std::move(value)) {}
  std::string value_;
};

// A peer was seen (again). label is absent for peers that publish no user data.
struct PeerDiscovered {
  PeerId peer;
  std::optional<std::string> label;
  std::string source;
};

// A previously discovered peer has not been heard from within its TTL
struct PeerExpired {
  PeerId peer;
};

using DiscoveryEvent = std::variant<PeerDiscovered, PeerExpired>;

// Point-in-time record from the endpoint's routing table
struct RemoteInfo {
  PeerId peer;
  std::optional<std::string> label;
  std::string source;
  std::chrono::steady_clock::time_point last_seen;
};

/**
 * DiscoveryStream - live sequence of discovery events for one subscriber
 *
 * AsyncNext completion semantics:
 * - ec == operation_aborted: read cancelled via Cancel()
 * - other ec: transient stream error, the stream stays usable
 * - no ec, event set: next event in emission order
 * - no ec, event empty: end of stream (endpoint closed)
 *
 * At most one read may be outstanding. Handlers never run inline from
 * AsyncNext; they are posted to the stream's executor.
 */
class DiscoveryStream {
public:
  using NextHandler = std::function<void(const boost::system::error_code &ec,
                                         std::optional<DiscoveryEvent> event)>;

  virtual ~DiscoveryStream() = default;

  virtual void AsyncNext(NextHandler handler) = 0;

  // Complete the pending read (if any) with operation_aborted
  virtual void Cancel() = 0;
};

using DiscoveryStreamPtr = std::shared_ptr<DiscoveryStream>;

/**
 * Endpoint - this process's network identity as seen by the discovery layer
 */
class Endpoint {
public:
  using CloseCallback = std::function<void()>;

  virtual ~Endpoint() = default;

  virtual const PeerId &node_id() const = 0;

  // New independent stream receiving every event emitted from now on
  virtual DiscoveryStreamPtr SubscribeDiscovery() = 0;

  // Snapshot of currently known peers (unordered; may include self)
  virtual std::vector<RemoteInfo> RemoteInfos() const = 0;

  // Stop advertising, end every stream, release sockets. Callback is posted
  // once closing completes. Safe to call more than once.
  virtual void AsyncClose(CloseCallback callback) = 0;

  virtual bool is_closed() const = 0;
};

using EndpointPtr = std::shared_ptr<Endpoint>;

struct EndpointConfig {
  UserData user_data;
};

/**
 * EndpointBinder - factory creating bound endpoints
 *
 * The endpoint runs its I/O on `io_context`, which must outlive it. The
 * callback is posted to `io_context` and receives the endpoint, or nullptr
 * and a reason on failure.
 */
class EndpointBinder {
public:
  using BindCallback =
      std::function<void(EndpointPtr endpoint, const std::string &error)>;

  virtual ~EndpointBinder() = default;

  virtual void AsyncBind(boost::asio::io_context &io_context,
                         const EndpointConfig &config,
                         BindCallback callback) = 0;
};

using EndpointBinderPtr = std::shared_ptr<EndpointBinder>;

} // namespace network
} // namespace lanpeer
