// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

#include <asio.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>

namespace synthnet {
namespace network {

class RealTransportConnection;
using TransportConnectionPtr = std::shared_ptr<RealTransportConnection>;

// Connect completion: success, asio::error::timed_out when the connect
// deadline expired, or the socket error otherwise
using ConnectCallback = std::function<void(const asio::error_code& ec)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t>& data)>;
using DisconnectCallback = std::function<void()>;

// RealTransportConnection - one TCP stream on a caller-owned io_context.
// Every socket operation, callback and timer runs on the connection's strand,
// so the owner can use strand() as the executor for its own per-connection state.
class RealTransportConnection : public std::enable_shared_from_this<RealTransportConnection> {
public:
  // Create outbound connection; nothing happens until async_connect()
  static TransportConnectionPtr create_outbound(asio::io_context& io_context, const asio::ip::tcp::endpoint& remote);

  // Create inbound connection (already connected socket)
  static TransportConnectionPtr create_inbound(asio::io_context& io_context, asio::ip::tcp::socket socket);

  ~RealTransportConnection();

  // Non-copyable, non-movable (connections are not reusable)
  RealTransportConnection(const RealTransportConnection&) = delete;
  RealTransportConnection& operator=(const RealTransportConnection&) = delete;
  RealTransportConnection(RealTransportConnection&&) = delete;
  RealTransportConnection& operator=(RealTransportConnection&&) = delete;

  // Dial the remote endpoint (outbound only, once). `connect_timeout` of 0
  // disables the deadline. `callback` runs on the strand.
  void async_connect(std::chrono::milliseconds connect_timeout, ConnectCallback callback);

  // Begin the read loop (no-op unless open)
  void start();

  // Queue bytes on the single-writer queue. Returns false only if the
  // connection is already closed; overflow closes the connection later.
  bool send(const std::vector<uint8_t>& data);

  void close();
  bool is_open() const;
  bool is_inbound() const { return is_inbound_; }
  uint64_t id() const { return id_; }

  // Remote endpoint as dialed (outbound) or as accepted (inbound)
  asio::ip::tcp::endpoint remote_endpoint() const { return remote_endpoint_; }

  void set_receive_callback(ReceiveCallback callback);
  void set_disconnect_callback(DisconnectCallback callback);

  const asio::strand<asio::any_io_executor>& strand() const { return strand_; }

private:
  RealTransportConnection(asio::io_context& io_context, bool is_inbound);

  void do_connect(std::chrono::milliseconds connect_timeout, ConnectCallback callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void finish_connect(const asio::error_code& ec, const ConnectCallback& callback);

  // Deliver the disconnect callback exactly once (must be called on strand)
  void deliver_disconnect_once();

  asio::io_context& io_context_;
  asio::ip::tcp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 256 * 1024;  // 256 KB

  // Connect deadline. Held by pointer so close_impl() can destroy it while
  // the io_context is still alive.
  std::unique_ptr<asio::steady_timer> connect_timer_;
  bool connect_done_{false};

  std::atomic<bool> open_{false};
  asio::ip::tcp::endpoint remote_endpoint_;
};

// RealTransport - dials outbound connections and runs the TCP listener.
// Uses an external io_context; the caller runs it (typically on a thread pool).
class RealTransport : public std::enable_shared_from_this<RealTransport> {
public:
  using AcceptCallback = std::function<void(TransportConnectionPtr)>;

  // The io_context must outlive this RealTransport instance.
  explicit RealTransport(asio::io_context& io_context);
  ~RealTransport();

  RealTransport(const RealTransport&) = delete;
  RealTransport& operator=(const RealTransport&) = delete;

  TransportConnectionPtr connect(const asio::ip::tcp::endpoint& remote, std::chrono::milliseconds connect_timeout,
                                 ConnectCallback callback);

  // Bind and accept on `port` (0 = ephemeral). Must be called on a
  // shared_ptr-owned instance. Returns false if binding fails.
  bool listen(uint16_t port, AcceptCallback accept_callback);

  void stop_listening();

  // stop() closes the listener but does not stop the io_context
  void stop();

  bool is_running() const { return running_; }

  asio::io_context& io_context() { return io_context_; }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const;

private:
  // Requires acceptor_mutex_
  void start_accept();
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);

  asio::io_context& io_context_;
  std::atomic<bool> running_{true};

  // Guards acceptor_ and accept_callback_ (stop_listening() may run off the io threads)
  std::mutex acceptor_mutex_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<uint16_t> last_listen_port_{0};
};

}  // namespace network
}  // namespace synthnet
