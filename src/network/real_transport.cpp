// Copyright (c) 2025 The Unicity Foundation
// Real transport implementation using asio TCP sockets

#include "network/real_transport.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace synthnet {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

TransportConnectionPtr RealTransportConnection::create_outbound(
    asio::io_context& io_context,
    const asio::ip::tcp::endpoint& remote)
{
  auto conn = std::shared_ptr<RealTransportConnection>(new RealTransportConnection(io_context, false));
  conn->remote_endpoint_ = remote;
  return conn;
}

void RealTransportConnection::async_connect(std::chrono::milliseconds connect_timeout, ConnectCallback callback) {
  // Defer do_connect onto the strand so the object lifetime is extended
  // regardless of what the caller does with its reference
  asio::post(strand_, [self = shared_from_this(), connect_timeout, callback = std::move(callback)]() mutable {
    self->do_connect(connect_timeout, std::move(callback));
  });
}

TransportConnectionPtr RealTransportConnection::create_inbound(
    asio::io_context& io_context,
    asio::ip::tcp::socket socket)
{
  auto conn = std::shared_ptr<RealTransportConnection>(new RealTransportConnection(io_context, true));
  asio::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  if (ec) {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  } else if (remote.address().is_v6() && remote.address().to_v6().is_v4_mapped()) {
    // Dual-stack listener: report IPv4 peers as IPv4
    remote = asio::ip::tcp::endpoint(asio::ip::make_address_v4(asio::ip::v4_mapped, remote.address().to_v6()),
                                     remote.port());
  }
  conn->remote_endpoint_ = remote;
  conn->socket_ = std::move(socket);
  conn->open_ = true;
  return conn;
}

RealTransportConnection::RealTransportConnection(asio::io_context& io_context, bool is_inbound)
    : io_context_(io_context)
    , socket_(io_context)
    , strand_(asio::make_strand(io_context.get_executor()))
    , is_inbound_(is_inbound)
    , id_(next_id_++)
    , connect_timer_(std::make_unique<asio::steady_timer>(io_context))
{
}

RealTransportConnection::~RealTransportConnection() = default;

void RealTransportConnection::do_connect(std::chrono::milliseconds connect_timeout, ConnectCallback callback) {
  connect_done_ = false;

  if (connect_timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(connect_timeout);

    auto timeout_handler = [this, self = shared_from_this(), callback](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || connect_done_) {
        return;
      }
      LOG_NET_DEBUG("connect timeout to {}", protocol::EndpointToString(remote_endpoint_));
      asio::error_code ignored;
      socket_.cancel(ignored);
      socket_.close(ignored);
      finish_connect(asio::error::timed_out, callback);
    };

    connect_timer_->async_wait(asio::bind_executor(strand_, timeout_handler));
  }

  auto connect_handler = [this, self = shared_from_this(), callback](const asio::error_code& ec) {
    if (connect_done_)
      return;

    if (ec) {
      LOG_NET_TRACE("failed to connect to {}: {}", protocol::EndpointToString(remote_endpoint_), ec.message());
      finish_connect(ec, callback);
      return;
    }

    open_ = true;

    // Best-effort TCP options
    asio::error_code opt_ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);
    socket_.set_option(asio::socket_base::keep_alive(true), opt_ec);

    finish_connect(ec, callback);
  };

  socket_.async_connect(remote_endpoint_, asio::bind_executor(strand_, connect_handler));
}

void RealTransportConnection::finish_connect(const asio::error_code& ec, const ConnectCallback& callback) {
  connect_done_ = true;
  if (connect_timer_)
    (void)connect_timer_->cancel();
  if (!callback)
    return;
  try {
    callback(ec);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("exception in connect callback for {}: {}", protocol::EndpointToString(remote_endpoint_),
                  e.what());
  }
}

void RealTransportConnection::start() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_)
    return;

  // Fresh buffer per read so a stray second read can never share storage
  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);

  auto read_handler = [this, self = shared_from_this(), buf](const asio::error_code& ec, size_t bytes_transferred) {
    if (!open_) {
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_NET_TRACE("read error from {}: {}", protocol::EndpointToString(remote_endpoint_), ec.message());
      }
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (bytes_transferred > 0) {
      ReceiveCallback saved_receive_cb = receive_callback_;
      if (saved_receive_cb) {
        std::vector<uint8_t> data(buf->begin(), buf->begin() + bytes_transferred);
        try {
          saved_receive_cb(data);
        } catch (const std::exception& e) {
          LOG_NET_ERROR("exception in receive callback from {}: {}", protocol::EndpointToString(remote_endpoint_),
                        e.what());
        }
      }

      // The receive callback may have closed the connection
      if (!open_) {
        return;
      }
    }

    start_read_impl();
  };

  socket_.async_read_some(asio::buffer(*buf), asio::bind_executor(strand_, read_handler));
}

// Returns false only if the connection is already closed at call time.
// Queue overflow is enforced on the strand and closes the connection, so a
// `true` return means "accepted", not "written".
bool RealTransportConnection::send(const std::vector<uint8_t>& data) {
  if (!open_)
    return false;
  // Copy before posting: the caller may destroy `data` as soon as we return
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_)
      return;

    if (send_queue_bytes_ + payload->size() > protocol::DEFAULT_SEND_QUEUE_SIZE) {
      LOG_NET_WARN_RL("Send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), disconnecting "
                      "slow-reading peer {}",
                      send_queue_bytes_, payload->size(), protocol::DEFAULT_SEND_QUEUE_SIZE,
                      protocol::EndpointToString(remote_endpoint_));
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_)
    return;

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  auto write_handler = [this, self = shared_from_this(), data_ptr](const asio::error_code& ec,
                                                                    size_t /*bytes_transferred*/) {
    if (!open_) {
      return;
    }

    if (ec) {
      LOG_NET_TRACE("write error to {}: {}", protocol::EndpointToString(remote_endpoint_), ec.message());
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_bytes_ -= data_ptr->size();
    send_queue_.pop();

    if (!send_queue_.empty()) {
      do_write_impl();
    } else {
      writing_ = false;
    }
  };

  asio::async_write(socket_, asio::buffer(*data_ptr), asio::bind_executor(strand_, write_handler));
}

void RealTransportConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Post to the io_context (not the strand) to avoid re-entering it
    asio::post(io_context_, [cb = std::move(saved_disconnect_cb), ep = remote_endpoint_]() {
      try {
        cb();
      } catch (const std::exception& e) {
        LOG_NET_ERROR("exception in disconnect callback for {}: {}", protocol::EndpointToString(ep), e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  asio::dispatch(strand_, [this, self = shared_from_this()]() { close_impl(); });
}

void RealTransportConnection::close_impl() {
  if (!open_.exchange(false)) {
    // Never opened (connect pending) or already closed: still tear down the
    // socket so a pending async_connect completes with operation_aborted
    asio::error_code ignored;
    socket_.cancel(ignored);
    socket_.close(ignored);
    if (connect_timer_)
      (void)connect_timer_->cancel();
    return;
  }

  // Keep callbacks alive until the socket is cancelled so final events are not lost
  ReceiveCallback saved_receive_cb = std::move(receive_callback_);
  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  receive_callback_ = {};
  disconnect_callback_ = {};

  // Cancel outstanding operations; handlers complete with operation_aborted
  // and release their shared_ptr to us
  {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.cancel(ec);
    socket_.close(ec);
  }

  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }

  // Release queued buffers off the strand
  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_ = false;

  if (!queue_to_destroy.empty()) {
    asio::post(io_context_, [queue = std::move(queue_to_destroy)]() mutable { (void)queue; });
  }
}

bool RealTransportConnection::is_open() const {
  return open_;
}

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(DisconnectCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(asio::io_context& io_context) : io_context_(io_context) {}

RealTransport::~RealTransport() {
  stop();
}

TransportConnectionPtr RealTransport::connect(const asio::ip::tcp::endpoint& remote,
                                              std::chrono::milliseconds connect_timeout, ConnectCallback callback) {
  auto conn = RealTransportConnection::create_outbound(io_context_, remote);
  conn->async_connect(connect_timeout, std::move(callback));
  return conn;
}

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  using tcp = asio::ip::tcp;
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
  asio::error_code ec;

  // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
  acceptor->open(tcp::v6(), ec);
  if (!ec)
    acceptor->set_option(asio::ip::v6_only(false), ec);
  if (!ec)
    acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec)
    acceptor->bind(tcp::endpoint(tcp::v6(), port), ec);
  if (!ec)
    acceptor->listen(asio::socket_base::max_listen_connections, ec);

  if (ec) {
    asio::error_code close_ec;
    acceptor->close(close_ec);
    ec.clear();
    acceptor->open(tcp::v4(), ec);
    if (!ec)
      acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec)
      acceptor->bind(tcp::endpoint(tcp::v4(), port), ec);
    if (!ec)
      acceptor->listen(asio::socket_base::max_listen_connections, ec);
  }

  if (ec) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
    asio::error_code close_ec;
    acceptor->close(close_ec);
    accept_callback_ = {};
    return false;
  }

  // Record the actual bound port (handles ephemeral port 0)
  {
    asio::error_code ep_ec;
    auto ep = acceptor->local_endpoint(ep_ec);
    last_listen_port_ = ep_ec ? 0 : ep.port();
  }

  acceptor_ = std::move(acceptor);
  LOG_NET_INFO("listening on port {}", last_listen_port_.load());
  start_accept();
  return true;
}

void RealTransport::start_accept() {
  if (!acceptor_)
    return;

  // Keep the transport alive until the pending accept completes
  acceptor_->async_accept([self = shared_from_this()](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    self->handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    if (ec != asio::error::operation_aborted && acceptor_) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  AcceptCallback accept_cb;
  {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    if (!acceptor_) {
      // Listener closed while this accept was completing
      asio::error_code close_ec;
      socket.close(close_ec);
      return;
    }
    accept_cb = accept_callback_;
  }

  asio::error_code opt_ec;
  socket.set_option(asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(asio::socket_base::keep_alive(true), opt_ec);

  auto conn = RealTransportConnection::create_inbound(io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {} accepted", protocol::EndpointToString(conn->remote_endpoint()));

  if (accept_cb) {
    try {
      accept_cb(conn);
    } catch (const std::exception& e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
    }
  }

  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  start_accept();
}

void RealTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  // Clear the callback to release anything it captured
  accept_callback_ = {};
}

uint16_t RealTransport::listening_port() const {
  return last_listen_port_;
}

void RealTransport::stop() {
  running_.store(false);
  stop_listening();
}

}  // namespace network
}  // namespace synthnet
