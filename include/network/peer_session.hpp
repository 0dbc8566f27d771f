// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_types.hpp"
#include "network/message.hpp"
#include "network/node_config.hpp"
#include "network/real_transport.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

#include <asio.hpp>

namespace synthnet {
namespace network {

class PeerSession;
using PeerSessionPtr = std::shared_ptr<PeerSession>;

// Decoded message that passed the session's filter (called on the session strand,
// so calls for one session are ordered)
using SessionMessageHandler = std::function<void(PeerSessionPtr session, message::Message msg)>;

// Handshake finished: NodeError::None once Ready, otherwise the reason it failed
using SessionReadyHandler = std::function<void(PeerSessionPtr session, NodeError result)>;

// Connection closed for `reason`, delivered exactly once
using SessionCloseHandler = std::function<void(PeerSessionPtr session, NodeError reason)>;

// PeerSession - protocol state for one connection of a synthetic node.
// Handles TCP connect completion, frame reassembly and decoding, the
// VERSION/VERACK handshake, auto-replies and the handshake deadline.
//
// PeerSession is single-use: once closed it is never restarted.
//
// Threading Model:
// - All state changes, timers and transport callbacks run on the transport
//   connection's strand, so no locks are needed for recv_buffer_, timers, etc.
// - state() and close_reason() are atomics so the owning node can read them
//   from any thread.
// - send_message() and disconnect() may be called from any thread.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // Outbound: start() dials `remote`. The session stays in Connecting until
  // the TCP connect completes.
  static PeerSessionPtr create_outbound(asio::io_context& io_context, std::shared_ptr<const SyntheticNodeConfig> config,
                                        const asio::ip::tcp::endpoint& remote);

  // Inbound: wrap an accepted connection
  static PeerSessionPtr create_inbound(TransportConnectionPtr connection,
                                       std::shared_ptr<const SyntheticNodeConfig> config);

  PeerSession(PrivateTag, TransportConnectionPtr connection, std::shared_ptr<const SyntheticNodeConfig> config,
              const asio::ip::tcp::endpoint& remote, ConnectionDirection direction);
  ~PeerSession();

  PeerSession(const PeerSession&) = delete;
  PeerSession& operator=(const PeerSession&) = delete;

  // Handlers must be installed before start()
  void set_message_handler(SessionMessageHandler handler) { message_handler_ = std::move(handler); }
  void set_ready_handler(SessionReadyHandler handler) { ready_handler_ = std::move(handler); }
  void set_close_handler(SessionCloseHandler handler) { close_handler_ = std::move(handler); }

  // Outbound: begin connecting. Inbound: begin reading and await the peer's VERSION.
  void start();

  // Encode and queue one frame. Returns false if the connection is not open.
  bool send_message(const message::Message& msg);

  // Close the connection; handlers see `reason`
  void disconnect(NodeError reason = NodeError::None);

  SessionState state() const { return state_.load(); }
  bool is_ready() const { return state_.load() == SessionState::Ready; }
  NodeError close_reason() const { return close_reason_.load(); }
  ConnectionDirection direction() const { return direction_; }
  bool is_inbound() const { return direction_ == ConnectionDirection::Inbound; }
  const asio::ip::tcp::endpoint& remote_endpoint() const { return remote_; }
  uint64_t id() const { return id_; }

private:
  void on_connect(const asio::error_code& ec);
  void begin_session();
  void on_transport_receive(const std::vector<uint8_t>& data);
  void on_transport_disconnect();

  // Frame reassembly (recv_buffer_ with read offset)
  void process_received_data();
  void process_message(message::Message msg);
  void dispatch_ready_message(message::Message msg);

  // Handshake
  void send_version();
  void handle_handshake_message(const message::Message& msg);
  void mark_ready();

  void start_handshake_timer();
  void do_disconnect(NodeError reason);
  void post_disconnect(NodeError reason);

  TransportConnectionPtr connection_;
  std::shared_ptr<const SyntheticNodeConfig> config_;
  asio::ip::tcp::endpoint remote_;
  ConnectionDirection direction_;
  uint64_t id_;
  asio::steady_timer handshake_timer_;

  std::atomic<SessionState> state_;
  std::atomic<NodeError> close_reason_{NodeError::None};
  std::atomic<bool> started_{false};
  bool ready_delivered_{false};
  bool early_verack_{false};

  SessionMessageHandler message_handler_;
  SessionReadyHandler ready_handler_;
  SessionCloseHandler close_handler_;

  // Receive buffer (accumulates data until complete message received)
  std::vector<uint8_t> recv_buffer_;
  size_t recv_buffer_offset_ = 0;

  static std::atomic<uint64_t> next_id_;
};

}  // namespace network
}  // namespace synthnet
