// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_session.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace synthnet {
namespace network {

namespace {

// Longest user agent we echo into the log
constexpr size_t MAX_LOGGED_USER_AGENT = 256;

std::string sanitize_user_agent(const std::string& user_agent) {
  std::string sanitized = user_agent;
  if (sanitized.size() > MAX_LOGGED_USER_AGENT) {
    sanitized.resize(MAX_LOGGED_USER_AGENT);
    sanitized += "...[truncated]";
  }
  // Remove control characters (except tab), including NULs
  sanitized.erase(std::remove_if(sanitized.begin(), sanitized.end(),
                                 [](unsigned char c) { return c < 32 && c != '\t'; }),
                  sanitized.end());
  return sanitized;
}

}  // namespace

std::atomic<uint64_t> PeerSession::next_id_{1};

PeerSessionPtr PeerSession::create_outbound(asio::io_context& io_context,
                                            std::shared_ptr<const SyntheticNodeConfig> config,
                                            const asio::ip::tcp::endpoint& remote) {
  auto connection = RealTransportConnection::create_outbound(io_context, remote);
  return std::make_shared<PeerSession>(PrivateTag{}, connection, std::move(config), remote,
                                       ConnectionDirection::Outbound);
}

PeerSessionPtr PeerSession::create_inbound(TransportConnectionPtr connection,
                                           std::shared_ptr<const SyntheticNodeConfig> config) {
  auto remote = connection->remote_endpoint();
  return std::make_shared<PeerSession>(PrivateTag{}, std::move(connection), std::move(config), remote,
                                       ConnectionDirection::Inbound);
}

PeerSession::PeerSession(PrivateTag, TransportConnectionPtr connection,
                         std::shared_ptr<const SyntheticNodeConfig> config, const asio::ip::tcp::endpoint& remote,
                         ConnectionDirection direction)
    : connection_(std::move(connection)), config_(std::move(config)), remote_(remote), direction_(direction),
      id_(next_id_++), handshake_timer_(connection_->strand()), state_(SessionState::Connecting) {}

PeerSession::~PeerSession() = default;

void PeerSession::start() {
  if (started_.exchange(true)) {
    LOG_NET_ERROR("session {} restart attempted; sessions are single-use", id_);
    return;
  }

  auto self = shared_from_this();
  asio::dispatch(connection_->strand(), [self]() {
    // disconnect() before start() leaves nothing to do
    if (self->state_ == SessionState::Disconnected)
      return;

    if (self->direction_ == ConnectionDirection::Outbound) {
      LOG_NET_DEBUG("connecting to {} peer={}", protocol::EndpointToString(self->remote_), self->id_);
      self->connection_->async_connect(self->config_->connect_timeout,
                                       [self](const asio::error_code& ec) { self->on_connect(ec); });
    } else {
      self->begin_session();
    }
  });
}

void PeerSession::on_connect(const asio::error_code& ec) {
  // Closed while connecting; do_disconnect() already reported the reason
  if (state_ == SessionState::Disconnected)
    return;

  if (ec) {
    NodeError reason = ec == asio::error::timed_out ? NodeError::HandshakeTimeout : NodeError::ConnectFailed;
    LOG_NET_DEBUG("connect to {} failed: {} peer={}", protocol::EndpointToString(remote_), ec.message(), id_);
    do_disconnect(reason);
    return;
  }

  begin_session();
}

void PeerSession::begin_session() {
  // Capture shared_ptr in callbacks; do_disconnect() clears them to break the cycle
  PeerSessionPtr self = shared_from_this();
  connection_->set_receive_callback([self](const std::vector<uint8_t>& data) { self->on_transport_receive(data); });
  connection_->set_disconnect_callback([self]() { self->on_transport_disconnect(); });
  connection_->start();

  if (config_->handshake == HandshakeMode::None) {
    mark_ready();
    return;
  }

  // Outbound: we initiated, so we send VERSION first
  // Inbound: they initiated, so we wait for their VERSION
  if (direction_ == ConnectionDirection::Outbound) {
    send_version();
  }
  state_ = SessionState::AwaitingPeerVersion;
  start_handshake_timer();
}

bool PeerSession::send_message(const message::Message& msg) {
  if (state_ == SessionState::Disconnected || !connection_->is_open()) {
    return false;
  }

  auto frame = message::EncodeMessage(config_->network_magic, msg);
  LOG_NET_TRACE("sending {} ({} bytes) to peer={}", message::CommandOf(msg), frame.size(), id_);
  if (!connection_->send(frame)) {
    LOG_NET_DEBUG("failed to send {} to peer={}", message::CommandOf(msg), id_);
    return false;
  }
  return true;
}

void PeerSession::disconnect(NodeError reason) {
  auto self = shared_from_this();
  asio::dispatch(connection_->strand(), [self, reason]() { self->do_disconnect(reason); });
}

void PeerSession::post_disconnect(NodeError reason) {
  // Defer until the current handler has finished touching our state
  auto self = shared_from_this();
  asio::post(connection_->strand(), [self, reason]() { self->do_disconnect(reason); });
}

void PeerSession::do_disconnect(NodeError reason) {
  if (state_ == SessionState::Disconnected) {
    return;
  }

  const bool was_ready = state_ == SessionState::Ready;
  close_reason_ = reason;
  state_ = SessionState::Disconnected;
  handshake_timer_.cancel();

  LOG_NET_DEBUG("disconnecting peer={} ({}): {}", id_, protocol::EndpointToString(remote_), NodeErrorAsString(reason));

  // Clear callbacks BEFORE closing so no queued read re-enters this session
  connection_->set_receive_callback({});
  connection_->set_disconnect_callback({});
  connection_->close();

  // Close first so the owner has untracked us before a pending connect completes
  PeerSessionPtr self = shared_from_this();
  auto close_handler = std::move(close_handler_);
  close_handler_ = {};
  message_handler_ = {};
  if (close_handler) {
    close_handler(self, reason);
  }

  if (!was_ready && !ready_delivered_) {
    ready_delivered_ = true;
    auto ready_handler = std::move(ready_handler_);
    ready_handler_ = {};
    if (ready_handler) {
      ready_handler(self, reason == NodeError::None ? NodeError::Transport : reason);
    }
  }
}

void PeerSession::on_transport_receive(const std::vector<uint8_t>& data) {
  if (state_ == SessionState::Disconnected)
    return;

  // Check the incoming chunk before any allocation
  if (data.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
    LOG_NET_WARN_RL("Oversized chunk received ({} bytes, limit: {} bytes), disconnecting from peer={}", data.size(),
                    protocol::DEFAULT_RECV_FLOOD_SIZE, id_);
    post_disconnect(NodeError::Transport);
    return;
  }

  size_t usable_bytes = recv_buffer_.size() - recv_buffer_offset_;
  if (usable_bytes + data.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
    LOG_NET_WARN_RL("Receive buffer overflow (usable: {} bytes, incoming: {} bytes, limit: {} bytes), "
                    "disconnecting from peer={}",
                    usable_bytes, data.size(), protocol::DEFAULT_RECV_FLOOD_SIZE, id_);
    post_disconnect(NodeError::Transport);
    return;
  }

  // Compact once the consumed prefix is at least half the buffer
  if (recv_buffer_offset_ > 0 && recv_buffer_offset_ >= recv_buffer_.size() / 2) {
    recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + recv_buffer_offset_);
    recv_buffer_offset_ = 0;
    if (recv_buffer_.size() < 1024) {
      recv_buffer_.shrink_to_fit();
    }
  }

  recv_buffer_.insert(recv_buffer_.end(), data.begin(), data.end());
  process_received_data();
}

void PeerSession::on_transport_disconnect() {
  // Delivered on the io_context, not the strand
  auto self = shared_from_this();
  asio::dispatch(connection_->strand(), [self]() { self->do_disconnect(NodeError::Transport); });
}

void PeerSession::process_received_data() {
  while (state_ != SessionState::Disconnected &&
         recv_buffer_.size() - recv_buffer_offset_ >= protocol::MESSAGE_HEADER_SIZE) {
    const uint8_t* read_ptr = recv_buffer_.data() + recv_buffer_offset_;
    size_t available = recv_buffer_.size() - recv_buffer_offset_;

    message::Message msg;
    auto result = message::DecodeFrame(config_->network_magic, read_ptr, available, msg);

    switch (result.error) {
    case message::DecodeError::Incomplete:
      // Wait for more data
      return;

    case message::DecodeError::BadMagic:
    case message::DecodeError::OversizedMessage:
    case message::DecodeError::ChecksumMismatch:
      // The stream can no longer be trusted
      LOG_NET_DEBUG("Header error: {} ({}), peer={}", message::DecodeErrorString(result.error), result.command, id_);
      do_disconnect(NodeError::Decode);
      return;

    case message::DecodeError::UnknownCommand:
      LOG_NET_WARN_RL("unknown message type: {} peer={}", result.command, id_);
      recv_buffer_offset_ += result.consumed;
      break;

    case message::DecodeError::None:
      recv_buffer_offset_ += result.consumed;
      process_message(std::move(msg));
      break;

    default:
      // Well-framed body that failed to parse: the peer misbehaved
      LOG_NET_WARN_RL("failed to decode {} from peer={}: {}, disconnecting", result.command, id_,
                      message::DecodeErrorString(result.error));
      recv_buffer_offset_ += result.consumed;
      do_disconnect(NodeError::Decode);
      return;
    }
  }
}

void PeerSession::process_message(message::Message msg) {
  LOG_NET_TRACE("received {} from peer={}", message::CommandOf(msg), id_);

  switch (state_.load()) {
  case SessionState::AwaitingPeerVersion:
  case SessionState::AwaitingPeerVerack:
    handle_handshake_message(msg);
    break;
  case SessionState::Ready:
    dispatch_ready_message(std::move(msg));
    break;
  default:
    break;
  }
}

void PeerSession::dispatch_ready_message(message::Message msg) {
  const auto action = config_->action_for(message::KindOf(msg));

  if (action == FilterAction::Drop) {
    LOG_NET_TRACE("dropping {} from peer={}", message::CommandOf(msg), id_);
    return;
  }

  if (action == FilterAction::AutoReply || action == FilterAction::AutoReplyAndPass) {
    if (auto reply = message::CanonicalReply(msg)) {
      send_message(*reply);
    }
    if (action == FilterAction::AutoReply) {
      return;
    }
  }

  if (message_handler_) {
    message_handler_(shared_from_this(), std::move(msg));
  }
}

void PeerSession::send_version() {
  auto version = message::Version::create(remote_, asio::ip::tcp::endpoint());
  version.services = config_->services;
  version.user_agent = config_->user_agent;
  version.start_height = config_->start_height;

  LOG_NET_DEBUG("send version message: version {}, blocks={}, them={}, peer={}", version.version,
                version.start_height, protocol::EndpointToString(remote_), id_);
  send_message(version);
}

void PeerSession::handle_handshake_message(const message::Message& msg) {
  switch (message::KindOf(msg)) {
  case message::MessageKind::Version: {
    if (state_ != SessionState::AwaitingPeerVersion) {
      LOG_NET_DEBUG("redundant version message from peer={}", id_);
      return;
    }
    const auto& version = std::get<message::Version>(msg);
    LOG_NET_DEBUG("receive version message: {}: version {}, blocks={}, peer={}",
                  sanitize_user_agent(version.user_agent), version.version, version.start_height, id_);

    // Inbound: answer with our VERSION before the VERACK
    if (direction_ == ConnectionDirection::Inbound) {
      send_version();
    }
    send_message(message::Verack{});

    if (early_verack_) {
      mark_ready();
      return;
    }
    state_ = SessionState::AwaitingPeerVerack;
    // Each handshake await gets its own deadline
    start_handshake_timer();
    return;
  }

  case message::MessageKind::Verack:
    if (state_ == SessionState::AwaitingPeerVerack) {
      mark_ready();
    } else {
      // Some peers acknowledge before sending their own VERSION
      early_verack_ = true;
    }
    return;

  default:
    LOG_NET_DEBUG("received {} before handshake complete from peer={}, ignoring", message::CommandOf(msg), id_);
    return;
  }
}

void PeerSession::mark_ready() {
  handshake_timer_.cancel();
  state_ = SessionState::Ready;

  LOG_NET_DEBUG("{} peer={} ({}) ready", is_inbound() ? "inbound" : "outbound", id_,
                protocol::EndpointToString(remote_));

  if (!ready_delivered_) {
    ready_delivered_ = true;
    auto ready_handler = std::move(ready_handler_);
    ready_handler_ = {};
    if (ready_handler) {
      ready_handler(shared_from_this(), NodeError::None);
    }
  }
}

void PeerSession::start_handshake_timer() {
  if (config_->io_timeout.count() <= 0) {
    return;
  }

  handshake_timer_.expires_after(config_->io_timeout);
  auto self = shared_from_this();
  handshake_timer_.async_wait([self](const asio::error_code& ec) {
    if (ec) {
      return;
    }
    auto state = self->state_.load();
    if (state == SessionState::AwaitingPeerVersion || state == SessionState::AwaitingPeerVerack) {
      LOG_NET_DEBUG("version handshake timeout ({}) peer={}", SessionStateAsString(state), self->id_);
      self->do_disconnect(NodeError::HandshakeTimeout);
    }
  });
}

}  // namespace network
}  // namespace synthnet
