// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/multicast_discovery.hpp"
#include "util/logging.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <utility>

namespace lanpeer {
namespace network {

using json = nlohmann::json;

// ============================================================================
// Beacon
// ============================================================================

std::string Beacon::Encode() const {
  json j;
  j["v"] = VERSION;
  j["node_id"] = node_id.ToString();
  if (user_data) {
    j["user_data"] = *user_data;
  }
  return j.dump();
}

std::optional<Beacon> Beacon::Decode(std::string_view payload) {
  // Non-throwing parse: returns a discarded value on syntax errors
  json j = json::parse(payload.begin(), payload.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  auto v = j.find("v");
  if (v == j.end() || !v->is_number_integer() || v->get<int>() != VERSION) {
    return std::nullopt;
  }

  auto id = j.find("node_id");
  if (id == j.end() || !id->is_string()) {
    return std::nullopt;
  }
  auto node_id = PeerId::FromHex(id->get<std::string>());
  if (!node_id) {
    return std::nullopt;
  }

  Beacon beacon;
  beacon.node_id = *node_id;

  auto ud = j.find("user_data");
  if (ud != j.end() && !ud->is_null()) {
    if (!ud->is_string()) {
      return std::nullopt;
    }
    auto label = UserData::Parse(ud->get<std::string>());
    if (!label) {
      return std::nullopt;
    }
    beacon.user_data = label->str();
  }

  return beacon;
}

// ============================================================================
// MulticastDiscovery
// ============================================================================

MulticastDiscovery::MulticastDiscovery(const Config &config) : config_(config) {}

void MulticastDiscovery::AsyncBind(boost::asio::io_context &io_context,
                                   const EndpointConfig &config,
                                   BindCallback callback) {
  auto endpoint = std::make_shared<MulticastEndpoint>(
      io_context, config_, PeerId::Random(), config.user_data);

  std::string error;
  if (!endpoint->Open(&error)) {
    LOG_DISC_WARN("Multicast bind failed: {}", error);
    boost::asio::post(io_context, [callback = std::move(callback), error]() {
      callback(nullptr, error);
    });
    return;
  }

  endpoint->Start();
  LOG_DISC_DEBUG("Bound multicast endpoint {} on {}:{}",
                 endpoint->node_id().ShortString(), config_.group_address,
                 config_.port);

  boost::asio::post(io_context,
                    [callback = std::move(callback), endpoint]() {
                      callback(endpoint, std::string());
                    });
}

// ============================================================================
// MulticastEndpoint
// ============================================================================

MulticastEndpoint::MulticastEndpoint(boost::asio::io_context &io_context,
                                     const MulticastDiscovery::Config &config,
                                     PeerId node_id, UserData user_data)
    : io_context_(io_context), config_(config), node_id_(node_id),
      user_data_(std::move(user_data)),
      strand_(boost::asio::make_strand(io_context)), socket_(strand_),
      announce_timer_(strand_), expiry_timer_(strand_),
      receive_retry_timer_(strand_) {
  Beacon beacon;
  beacon.node_id = node_id_;
  beacon.user_data = user_data_.str();
  beacon_payload_ = std::make_shared<const std::string>(beacon.Encode());
}

MulticastEndpoint::~MulticastEndpoint() {
  boost::system::error_code ignored;
  socket_.close(ignored);
}

bool MulticastEndpoint::Open(std::string *error) {
  namespace ip = boost::asio::ip;
  boost::system::error_code ec;

  auto fail = [&](const char *what) {
    if (error) {
      *error = std::string(what) + ": " + ec.message();
    }
    boost::system::error_code ignored;
    socket_.close(ignored);
    return false;
  };

  const ip::address group = ip::make_address(config_.group_address, ec);
  if (ec) {
    return fail("invalid multicast group");
  }
  const ip::address listen = ip::make_address(config_.listen_address, ec);
  if (ec) {
    return fail("invalid listen address");
  }
  group_endpoint_ = ip::udp::endpoint(group, config_.port);

  socket_.open(group.is_v6() ? ip::udp::v6() : ip::udp::v4(), ec);
  if (ec) {
    return fail("socket open failed");
  }
  // Several processes on one host share the port
  socket_.set_option(ip::udp::socket::reuse_address(true), ec);
  if (ec) {
    return fail("SO_REUSEADDR failed");
  }
  socket_.bind(ip::udp::endpoint(listen, config_.port), ec);
  if (ec) {
    return fail("bind failed");
  }
  socket_.set_option(ip::multicast::join_group(group), ec);
  if (ec) {
    return fail("joining multicast group failed");
  }
  socket_.set_option(ip::multicast::hops(config_.multicast_ttl), ec);
  if (ec) {
    return fail("setting multicast TTL failed");
  }
  socket_.set_option(ip::multicast::enable_loopback(config_.loopback), ec);
  if (ec) {
    return fail("setting multicast loopback failed");
  }
  return true;
}

void MulticastEndpoint::Start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->is_closed()) {
      return;
    }
    self->start_receive();
    self->schedule_announce(std::chrono::steady_clock::duration::zero());
    self->schedule_expiry();
  });
}

DiscoveryStreamPtr MulticastEndpoint::SubscribeDiscovery() {
  auto stream =
      std::make_shared<BufferedDiscoveryStream>(io_context_.get_executor());
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_closed()) {
    stream->Close();
    return stream;
  }
  // Nodes heard before this subscription are replayed first, our own looped
  // back beacon included
  if (self_seen_) {
    stream->Push(
        PeerDiscovered{node_id_, user_data_.str(), MULTICAST_SOURCE});
  }
  for (const auto &[peer, entry] : peers_) {
    stream->Push(PeerDiscovered{peer, entry.label, MULTICAST_SOURCE});
  }
  streams_.push_back(stream);
  return stream;
}

std::vector<RemoteInfo> MulticastEndpoint::RemoteInfos() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RemoteInfo> infos;
  infos.reserve(peers_.size());
  for (const auto &[peer, entry] : peers_) {
    infos.push_back(RemoteInfo{peer, entry.label, MULTICAST_SOURCE,
                               entry.last_seen});
  }
  return infos;
}

void MulticastEndpoint::AsyncClose(CloseCallback callback) {
  boost::asio::dispatch(
      strand_, [self = shared_from_this(), callback = std::move(callback)]() {
        self->close_impl();
        if (callback) {
          boost::asio::post(self->io_context_, callback);
        }
      });
}

void MulticastEndpoint::close_impl() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  announce_timer_.cancel();
  expiry_timer_.cancel();
  receive_retry_timer_.cancel();
  boost::system::error_code ignored;
  socket_.close(ignored);

  std::vector<std::weak_ptr<BufferedDiscoveryStream>> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams.swap(streams_);
    peers_.clear();
  }
  for (auto &weak : streams) {
    if (auto stream = weak.lock()) {
      stream->Close();
    }
  }

  LOG_DISC_DEBUG("Multicast endpoint {} closed", node_id_.ShortString());
}

void MulticastEndpoint::start_receive() {
  socket_.async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_endpoint_,
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](
                       const boost::system::error_code &ec, size_t bytes) {
            if (self->is_closed() ||
                ec == boost::asio::error::operation_aborted) {
              return;
            }

            if (ec) {
              LOG_DISC_WARN("Multicast receive error: {}", ec.message());
              self->publish_error(ec);
              self->retry_receive();
              return;
            }

            self->HandleDatagram(
                std::string_view(self->recv_buffer_.data(), bytes));
            self->start_receive();
          }));
}

void MulticastEndpoint::retry_receive() {
  // A failing socket (interface down) would otherwise spin the strand
  receive_retry_timer_.expires_after(config_.receive_retry_delay);
  receive_retry_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec || self->is_closed()) {
          return;
        }
        self->start_receive();
      }));
}

void MulticastEndpoint::HandleDatagram(std::string_view payload) {
  auto beacon = Beacon::Decode(payload);
  if (!beacon) {
    LOG_DISC_DEBUG("Dropping malformed beacon ({} bytes)", payload.size());
    return;
  }

  // Our own beacon looped back: announced once to each subscriber, kept out
  // of the peer table. Later subscribers get it from SubscribeDiscovery().
  if (beacon->node_id == node_id_) {
    std::vector<std::shared_ptr<BufferedDiscoveryStream>> streams;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (self_seen_) {
        return;
      }
      self_seen_ = true;
      streams = live_streams_locked();
    }
    for (auto &stream : streams) {
      stream->Push(PeerDiscovered{beacon->node_id, beacon->user_data,
                                  MULTICAST_SOURCE});
    }
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  bool announce = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(beacon->node_id);
    if (it == peers_.end()) {
      peers_.emplace(beacon->node_id, PeerEntry{beacon->user_data, now});
      announce = true;
    } else {
      // A relabelled node is announced again
      announce = it->second.label != beacon->user_data;
      it->second.label = beacon->user_data;
      it->second.last_seen = now;
    }
  }

  if (announce) {
    LOG_DISC_TRACE("Beacon from new node {}", beacon->node_id.ShortString());
    publish(PeerDiscovered{beacon->node_id, beacon->user_data,
                           MULTICAST_SOURCE});
  }
}

void MulticastEndpoint::ExpirePeers(std::chrono::steady_clock::time_point now) {
  std::vector<PeerId> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end();) {
      if (now - it->second.last_seen > config_.peer_ttl) {
        expired.push_back(it->first);
        it = peers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &peer : expired) {
    LOG_DISC_DEBUG("Node {} expired", peer.ShortString());
    publish(PeerExpired{peer});
  }
}

void MulticastEndpoint::schedule_announce(
    std::chrono::steady_clock::duration delay) {
  announce_timer_.expires_after(delay);
  announce_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec || self->is_closed()) {
          return;
        }
        self->send_beacon();
        self->schedule_announce(self->config_.announce_interval);
      }));
}

void MulticastEndpoint::send_beacon() {
  auto payload = beacon_payload_;
  socket_.async_send_to(
      boost::asio::buffer(*payload), group_endpoint_,
      boost::asio::bind_executor(
          strand_, [self = shared_from_this(), payload](
                       const boost::system::error_code &ec, size_t) {
            if (ec && ec != boost::asio::error::operation_aborted) {
              LOG_DISC_DEBUG("Beacon send failed: {}", ec.message());
            }
          }));
}

void MulticastEndpoint::schedule_expiry() {
  // Half the TTL keeps expiry within 1.5 * peer_ttl of the last beacon
  expiry_timer_.expires_after(config_.peer_ttl / 2);
  expiry_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec || self->is_closed()) {
          return;
        }
        self->ExpirePeers(std::chrono::steady_clock::now());
        self->schedule_expiry();
      }));
}

std::vector<std::shared_ptr<BufferedDiscoveryStream>>
MulticastEndpoint::live_streams() {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_streams_locked();
}

std::vector<std::shared_ptr<BufferedDiscoveryStream>>
MulticastEndpoint::live_streams_locked() {
  std::vector<std::shared_ptr<BufferedDiscoveryStream>> live;
  for (auto it = streams_.begin(); it != streams_.end();) {
    if (auto stream = it->lock()) {
      live.push_back(std::move(stream));
      ++it;
    } else {
      it = streams_.erase(it);
    }
  }
  return live;
}

void MulticastEndpoint::publish(const DiscoveryEvent &event) {
  for (auto &stream : live_streams()) {
    stream->Push(event);
  }
}

void MulticastEndpoint::publish_error(const boost::system::error_code &ec) {
  for (auto &stream : live_streams()) {
    stream->PushError(ec);
  }
}

} // namespace network
} // namespace lanpeer
