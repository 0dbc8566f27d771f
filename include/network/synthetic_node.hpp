// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_types.hpp"
#include "network/message.hpp"
#include "network/node_config.hpp"
#include "network/peer_session.hpp"
#include "network/real_transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <asio.hpp>

namespace synthnet {
namespace network {

// One decoded message and the connection it arrived on
struct InboundMessage {
  asio::ip::tcp::endpoint from;
  message::Message msg;
};

/**
 * SyntheticNode - a scripted protocol peer used to exercise a node under test.
 *
 * Owns any number of connections (outbound and, when configured, inbound),
 * keyed by remote endpoint. Every Ready connection feeds one inbound queue in
 * arrival order; auto-replies and filters are applied per the configuration
 * before a message reaches the queue.
 *
 * The node runs on a caller-owned io_context, typically run by a thread pool.
 * The async_* operations never block. connect() and recv_message_timeout()
 * block the calling thread; called from a thread running the io_context they
 * fail with NodeError::WouldBlock instead of waiting.
 *
 * Lifetime: created through create() and owned by shared_ptr. shutdown() (or
 * destruction) closes every connection and fails every pending operation with
 * NodeError::ShuttingDown.
 */
class SyntheticNode : public std::enable_shared_from_this<SyntheticNode> {
private:
  struct PrivateTag {};

public:
  using ConnectHandler = std::function<void(NodeError result)>;
  using RecvHandler = std::function<void(NodeError result, InboundMessage inbound)>;
  using DisconnectHandler = std::function<void(const asio::ip::tcp::endpoint& remote, NodeError reason)>;

  static std::shared_ptr<SyntheticNode> create(asio::io_context& io_context,
                                               const SyntheticNodeConfig& config = SyntheticNodeConfig{});

  SyntheticNode(PrivateTag, asio::io_context& io_context, const SyntheticNodeConfig& config);
  ~SyntheticNode();

  SyntheticNode(const SyntheticNode&) = delete;
  SyntheticNode& operator=(const SyntheticNode&) = delete;

  // Start the listener when config.listen is set. Returns false if binding fails.
  bool start();

  // Open a connection and perform the configured handshake. The handler runs
  // once, with None when the connection is Ready.
  void async_connect(const asio::ip::tcp::endpoint& remote, ConnectHandler handler);
  NodeError connect(const asio::ip::tcp::endpoint& remote);

  // Encode `msg` and queue it on the connection to `remote`
  NodeError send_direct_message(const asio::ip::tcp::endpoint& remote, const message::Message& msg);

  // Oldest queued message from any connection, or Timeout after `timeout`.
  // A wait that times out never consumes a message.
  void async_recv_message(std::chrono::milliseconds timeout, RecvHandler handler);
  NodeError recv_message_timeout(std::chrono::milliseconds timeout, InboundMessage& out);

  // Close the connection to `remote`. Returns ConnectionNotFound if untracked.
  NodeError disconnect(const asio::ip::tcp::endpoint& remote);

  // Called when a connection closes on its own: Decode for a peer that sent
  // something undecodable, Transport for a reset or remote close,
  // HandshakeTimeout for a stalled handshake. Not called for disconnect() or
  // shutdown(). Runs on an io_context thread.
  void set_disconnect_handler(DisconnectHandler handler);

  // Endpoints of Ready connections
  std::vector<asio::ip::tcp::endpoint> connected_peers() const;
  size_t num_connected() const;

  // Tracked connections, including those still connecting or handshaking
  size_t num_tracked() const;

  // Messages waiting in the inbound queue
  size_t queued_messages() const;

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const;

  void shutdown();
  bool is_shut_down() const { return shutting_down_.load(); }

  const SyntheticNodeConfig& config() const { return *config_; }

private:
  struct RecvWaiter {
    RecvHandler handler;
    asio::steady_timer timer;
    bool done{false};

    RecvWaiter(asio::io_context& io_context, RecvHandler h)
        : handler(std::move(h)), timer(asio::make_strand(io_context)) {}
  };
  using RecvWaiterPtr = std::shared_ptr<RecvWaiter>;

  // Wire a session's handlers to this node
  void attach_session(const PeerSessionPtr& session, ConnectHandler connect_handler);

  void on_session_message(const PeerSessionPtr& session, message::Message msg);
  void on_session_closed(const PeerSessionPtr& session, NodeError reason);
  void on_inbound_connection(TransportConnectionPtr connection);

  // Cancel a waiter's timer on its own strand
  static void cancel_waiter_timer(const RecvWaiterPtr& waiter);

  asio::io_context& io_context_;
  std::shared_ptr<const SyntheticNodeConfig> config_;
  std::shared_ptr<RealTransport> transport_;
  std::atomic<bool> shutting_down_{false};

  // Guards sessions_, inbound_queue_, waiters_ and disconnect_handler_
  mutable std::mutex mutex_;
  std::map<asio::ip::tcp::endpoint, PeerSessionPtr> sessions_;
  std::deque<InboundMessage> inbound_queue_;
  std::deque<RecvWaiterPtr> waiters_;
  DisconnectHandler disconnect_handler_;
};

}  // namespace network
}  // namespace synthnet
