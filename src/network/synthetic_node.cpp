// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/synthetic_node.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <future>
#include <optional>
#include <utility>

namespace synthnet {
namespace network {

std::shared_ptr<SyntheticNode> SyntheticNode::create(asio::io_context& io_context, const SyntheticNodeConfig& config) {
  return std::make_shared<SyntheticNode>(PrivateTag{}, io_context, config);
}

SyntheticNode::SyntheticNode(PrivateTag, asio::io_context& io_context, const SyntheticNodeConfig& config)
    : io_context_(io_context), config_(std::make_shared<const SyntheticNodeConfig>(config)),
      transport_(std::make_shared<RealTransport>(io_context)) {}

SyntheticNode::~SyntheticNode() {
  shutdown();
}

bool SyntheticNode::start() {
  if (shutting_down_.load()) {
    return false;
  }
  if (!config_->listen) {
    return true;
  }

  std::weak_ptr<SyntheticNode> weak = weak_from_this();
  bool ok = transport_->listen(config_->listen_port, [weak](TransportConnectionPtr connection) {
    if (auto node = weak.lock()) {
      node->on_inbound_connection(std::move(connection));
    } else {
      connection->close();
    }
  });
  if (!ok) {
    LOG_NET_ERROR("synthetic node failed to listen on port {}", config_->listen_port);
    return false;
  }
  LOG_NET_INFO("synthetic node listening on port {}", transport_->listening_port());
  return true;
}

void SyntheticNode::async_connect(const asio::ip::tcp::endpoint& remote, ConnectHandler handler) {
  PeerSessionPtr session;
  NodeError error = NodeError::None;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
      error = NodeError::ShuttingDown;
    } else if (sessions_.count(remote) > 0) {
      error = NodeError::AlreadyConnected;
    } else if (sessions_.size() >= config_->max_peers) {
      error = NodeError::PeerLimit;
    } else {
      session = PeerSession::create_outbound(io_context_, config_, remote);
      sessions_[remote] = session;
    }
  }

  if (error != NodeError::None) {
    LOG_NET_DEBUG("connect to {} refused: {}", protocol::EndpointToString(remote), NodeErrorAsString(error));
    if (handler) {
      asio::post(io_context_, [handler = std::move(handler), error]() { handler(error); });
    }
    return;
  }

  attach_session(session, std::move(handler));
  session->start();
}

NodeError SyntheticNode::connect(const asio::ip::tcp::endpoint& remote) {
  if (io_context_.get_executor().running_in_this_thread()) {
    LOG_NET_ERROR("connect() called from an io_context thread, use async_connect()");
    return NodeError::WouldBlock;
  }
  auto promise = std::make_shared<std::promise<NodeError>>();
  auto future = promise->get_future();
  async_connect(remote, [promise](NodeError result) { promise->set_value(result); });
  return future.get();
}

NodeError SyntheticNode::send_direct_message(const asio::ip::tcp::endpoint& remote, const message::Message& msg) {
  PeerSessionPtr session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
      return NodeError::ShuttingDown;
    }
    auto it = sessions_.find(remote);
    if (it == sessions_.end()) {
      return NodeError::ConnectionNotFound;
    }
    session = it->second;
  }

  if (!session->is_ready()) {
    return NodeError::ConnectionNotFound;
  }
  if (!session->send_message(msg)) {
    return NodeError::Transport;
  }
  return NodeError::None;
}

void SyntheticNode::async_recv_message(std::chrono::milliseconds timeout, RecvHandler handler) {
  std::optional<InboundMessage> ready;
  RecvWaiterPtr waiter;
  bool shutting_down = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
      shutting_down = true;
    } else if (!inbound_queue_.empty()) {
      ready = std::move(inbound_queue_.front());
      inbound_queue_.pop_front();
    } else {
      waiter = std::make_shared<RecvWaiter>(io_context_, std::move(handler));
      waiters_.push_back(waiter);
    }
  }

  if (shutting_down) {
    asio::post(io_context_, [handler = std::move(handler)]() { handler(NodeError::ShuttingDown, InboundMessage{}); });
    return;
  }
  if (ready) {
    asio::post(io_context_, [handler = std::move(handler), inbound = std::move(*ready)]() mutable {
      handler(NodeError::None, std::move(inbound));
    });
    return;
  }

  // Arm on the timer's strand so a racing cancel is ordered after it
  std::weak_ptr<SyntheticNode> weak = weak_from_this();
  asio::dispatch(waiter->timer.get_executor(), [weak, waiter, timeout]() {
    {
      auto node = weak.lock();
      if (!node) {
        return;
      }
      std::lock_guard<std::mutex> lock(node->mutex_);
      if (waiter->done) {
        return;
      }
    }

    waiter->timer.expires_after(timeout);
    waiter->timer.async_wait([weak, waiter](const asio::error_code& ec) {
      if (ec) {
        return;
      }
      auto node = weak.lock();
      if (!node) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(node->mutex_);
        if (waiter->done) {
          return;
        }
        waiter->done = true;
        auto& waiters = node->waiters_;
        for (auto it = waiters.begin(); it != waiters.end(); ++it) {
          if (*it == waiter) {
            waiters.erase(it);
            break;
          }
        }
      }
      waiter->handler(NodeError::Timeout, InboundMessage{});
    });
  });
}

NodeError SyntheticNode::recv_message_timeout(std::chrono::milliseconds timeout, InboundMessage& out) {
  if (io_context_.get_executor().running_in_this_thread()) {
    LOG_NET_ERROR("recv_message_timeout() called from an io_context thread, use async_recv_message()");
    return NodeError::WouldBlock;
  }
  auto promise = std::make_shared<std::promise<std::pair<NodeError, InboundMessage>>>();
  auto future = promise->get_future();
  async_recv_message(timeout, [promise](NodeError result, InboundMessage inbound) {
    promise->set_value(std::make_pair(result, std::move(inbound)));
  });

  auto [result, inbound] = future.get();
  if (result == NodeError::None) {
    out = std::move(inbound);
  }
  return result;
}

NodeError SyntheticNode::disconnect(const asio::ip::tcp::endpoint& remote) {
  PeerSessionPtr session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(remote);
    if (it == sessions_.end()) {
      return NodeError::ConnectionNotFound;
    }
    session = it->second;
    sessions_.erase(it);
  }
  session->disconnect(NodeError::None);
  return NodeError::None;
}

void SyntheticNode::set_disconnect_handler(DisconnectHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_handler_ = std::move(handler);
}

std::vector<asio::ip::tcp::endpoint> SyntheticNode::connected_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<asio::ip::tcp::endpoint> peers;
  for (const auto& [endpoint, session] : sessions_) {
    if (session->is_ready()) {
      peers.push_back(endpoint);
    }
  }
  return peers;
}

size_t SyntheticNode::num_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [endpoint, session] : sessions_) {
    if (session->is_ready()) {
      ++count;
    }
  }
  return count;
}

size_t SyntheticNode::num_tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

size_t SyntheticNode::queued_messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inbound_queue_.size();
}

uint16_t SyntheticNode::listening_port() const {
  return transport_->listening_port();
}

void SyntheticNode::shutdown() {
  if (shutting_down_.exchange(true)) {
    return;
  }
  LOG_NET_DEBUG("synthetic node shutting down");

  transport_->stop();

  std::map<asio::ip::tcp::endpoint, PeerSessionPtr> sessions;
  std::deque<RecvWaiterPtr> waiters;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
    for (auto& waiter : waiters_) {
      if (!waiter->done) {
        waiter->done = true;
        waiters.push_back(waiter);
      }
    }
    waiters_.clear();
    inbound_queue_.clear();
  }

  for (auto& [endpoint, session] : sessions) {
    session->disconnect(NodeError::ShuttingDown);
  }
  for (auto& waiter : waiters) {
    cancel_waiter_timer(waiter);
    asio::post(io_context_, [waiter]() { waiter->handler(NodeError::ShuttingDown, InboundMessage{}); });
  }
}

void SyntheticNode::attach_session(const PeerSessionPtr& session, ConnectHandler connect_handler) {
  std::weak_ptr<SyntheticNode> weak = weak_from_this();

  session->set_message_handler([weak](PeerSessionPtr s, message::Message msg) {
    if (auto node = weak.lock()) {
      node->on_session_message(s, std::move(msg));
    }
  });

  session->set_ready_handler([connect_handler = std::move(connect_handler)](PeerSessionPtr s, NodeError result) {
    if (result == NodeError::None) {
      LOG_NET_DEBUG("peer={} {} ready", s->id(), protocol::EndpointToString(s->remote_endpoint()));
    }
    if (connect_handler) {
      connect_handler(result);
    }
  });

  session->set_close_handler([weak](PeerSessionPtr s, NodeError reason) {
    if (auto node = weak.lock()) {
      node->on_session_closed(s, reason);
    }
  });
}

void SyntheticNode::on_session_message(const PeerSessionPtr& session, message::Message msg) {
  InboundMessage inbound{session->remote_endpoint(), std::move(msg)};
  RecvWaiterPtr waiter;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
      return;
    }
    while (!waiters_.empty()) {
      auto front = waiters_.front();
      waiters_.pop_front();
      if (!front->done) {
        front->done = true;
        waiter = std::move(front);
        break;
      }
    }
    if (!waiter) {
      inbound_queue_.push_back(std::move(inbound));
      return;
    }
  }

  cancel_waiter_timer(waiter);
  asio::post(io_context_, [waiter, inbound = std::move(inbound)]() mutable {
    waiter->handler(NodeError::None, std::move(inbound));
  });
}

void SyntheticNode::on_session_closed(const PeerSessionPtr& session, NodeError reason) {
  DisconnectHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session->remote_endpoint());
    if (it != sessions_.end() && it->second == session) {
      sessions_.erase(it);
    }
    if (reason != NodeError::None && reason != NodeError::ShuttingDown) {
      handler = disconnect_handler_;
    }
  }
  LOG_NET_DEBUG("peer={} {} closed: {}", session->id(), protocol::EndpointToString(session->remote_endpoint()),
                NodeErrorAsString(reason));
  if (handler) {
    handler(session->remote_endpoint(), reason);
  }
}

void SyntheticNode::on_inbound_connection(TransportConnectionPtr connection) {
  const auto remote = connection->remote_endpoint();
  PeerSessionPtr session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
      connection->close();
      return;
    }
    if (sessions_.size() >= config_->max_peers) {
      LOG_NET_WARN_RL("rejecting inbound connection from {}: peer limit {} reached",
                      protocol::EndpointToString(remote), config_->max_peers);
      connection->close();
      return;
    }
    if (sessions_.count(remote) > 0) {
      LOG_NET_DEBUG("rejecting duplicate inbound connection from {}", protocol::EndpointToString(remote));
      connection->close();
      return;
    }
    session = PeerSession::create_inbound(connection, config_);
    sessions_[remote] = session;
  }

  LOG_NET_DEBUG("accepted inbound connection from {} peer={}", protocol::EndpointToString(remote), session->id());
  attach_session(session, nullptr);
  session->start();
}

void SyntheticNode::cancel_waiter_timer(const RecvWaiterPtr& waiter) {
  asio::post(waiter->timer.get_executor(), [waiter]() { waiter->timer.cancel(); });
}

}  // namespace network
}  // namespace synthnet
