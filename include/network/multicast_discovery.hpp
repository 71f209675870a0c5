// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include "network/discovery_stream.hpp"
#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanpeer {
namespace network {

// Source tag carried by events from the multicast binder
inline constexpr const char *MULTICAST_SOURCE = "local-network";

// Beacon payload: {"v":1,"node_id":"<64 hex>","user_data":"<label>"}
struct Beacon {
  static constexpr int VERSION = 1;

  PeerId node_id;
  std::optional<std::string> user_data;

  std::string Encode() const;

  // std::nullopt for anything that is not a well-formed version 1 beacon
  static std::optional<Beacon> Decode(std::string_view payload);
};

/**
 * MulticastDiscovery - binder for local network presence over UDP multicast
 *
 * Each bound endpoint joins the group, sends a beacon every
 * announce_interval and keeps a table of the nodes it hears. A node missing
 * for peer_ttl is expired. TTL 1 keeps beacons on the local link.
 */
class MulticastDiscovery : public EndpointBinder {
public:
  struct Config {
    std::string group_address;
    uint16_t port;
    std::string listen_address;
    int multicast_ttl;          // 1 = local subnet only
    bool loopback;              // deliver our own beacons (other processes on this host)
    std::chrono::steady_clock::duration announce_interval;
    std::chrono::steady_clock::duration peer_ttl;
    std::chrono::steady_clock::duration receive_retry_delay; // after a receive error

    Config()
        : group_address("239.255.42.99"), port(45454),
          listen_address("0.0.0.0"), multicast_ttl(1), loopback(true),
          announce_interval(std::chrono::seconds(1)),
          peer_ttl(std::chrono::seconds(5)),
          receive_retry_delay(std::chrono::milliseconds(500)) {}
  };

  explicit MulticastDiscovery(const Config &config = Config{});

  void AsyncBind(boost::asio::io_context &io_context,
                 const EndpointConfig &config, BindCallback callback) override;

  const Config &config() const { return config_; }

private:
  Config config_;
};

/**
 * MulticastEndpoint - one bound identity on the multicast group
 *
 * Socket, timers and the receive loop run on strand_. The peer table and
 * the subscriber list are guarded by mutex_ because RemoteInfos() and
 * SubscribeDiscovery() are called from other strands.
 */
class MulticastEndpoint : public Endpoint,
                          public std::enable_shared_from_this<MulticastEndpoint> {
public:
  MulticastEndpoint(boost::asio::io_context &io_context,
                    const MulticastDiscovery::Config &config, PeerId node_id,
                    UserData user_data);
  ~MulticastEndpoint() override;

  // Open, bind and join the group. False with *error set on failure.
  bool Open(std::string *error);

  // Begin receiving, announcing and expiring. Call once after Open().
  void Start();

  // Endpoint interface. RemoteInfos() never lists this endpoint itself;
  // SubscribeDiscovery() replays the nodes already in the table, and this
  // endpoint once its own beacon has looped back.
  const PeerId &node_id() const override { return node_id_; }
  DiscoveryStreamPtr SubscribeDiscovery() override;
  std::vector<RemoteInfo> RemoteInfos() const override;
  void AsyncClose(CloseCallback callback) override;
  bool is_closed() const override { return closed_.load(std::memory_order_acquire); }

  // Feed one datagram as if it had been received (used by the receive loop)
  void HandleDatagram(std::string_view payload);

  // Drop every node not heard from since `now - peer_ttl`
  void ExpirePeers(std::chrono::steady_clock::time_point now);

private:
  struct PeerEntry {
    std::optional<std::string> label;
    std::chrono::steady_clock::time_point last_seen;
  };

  void start_receive();
  void retry_receive();
  void schedule_announce(std::chrono::steady_clock::duration delay);
  void send_beacon();
  void schedule_expiry();
  void close_impl();

  // Deliver to every live subscriber. Caller must not hold mutex_.
  void publish(const DiscoveryEvent &event);
  void publish_error(const boost::system::error_code &ec);
  std::vector<std::shared_ptr<BufferedDiscoveryStream>> live_streams();
  std::vector<std::shared_ptr<BufferedDiscoveryStream>> live_streams_locked();

  boost::asio::io_context &io_context_;
  const MulticastDiscovery::Config config_;
  const PeerId node_id_;
  const UserData user_data_;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::ip::udp::endpoint group_endpoint_;
  boost::asio::ip::udp::endpoint sender_endpoint_;
  std::array<char, 1500> recv_buffer_{};
  boost::asio::steady_timer announce_timer_;
  boost::asio::steady_timer expiry_timer_;
  boost::asio::steady_timer receive_retry_timer_;
  std::shared_ptr<const std::string> beacon_payload_;

  std::atomic<bool> closed_{false};

  mutable std::mutex mutex_;
  bool self_seen_{false};
  std::map<PeerId, PeerEntry> peers_;
  std::vector<std::weak_ptr<BufferedDiscoveryStream>> streams_;
};

} // namespace network
} // namespace lanpeer
