// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <utility> // std::exchange; Boost 1.74 asio/awaitable.hpp omits it
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ziacoin {
namespace network {

/**
 * RealTransportConnection - one accepted TCP socket.
 *
 * Reads are line-framed with async_read_until on a streambuf capped at
 * MAX_MESSAGE_SIZE; an over-long frame closes the connection. An idle timer
 * closes the connection when nothing arrives for the idle timeout.
 * All state is touched on strand_.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  static std::shared_ptr<RealTransportConnection>
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket,
                 std::chrono::milliseconds idle_timeout);

  ~RealTransportConnection() override = default;

  RealTransportConnection(const RealTransportConnection &) = delete;
  RealTransportConnection &operator=(const RealTransportConnection &) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::string &line) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(LineCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io_context,
                          boost::asio::ip::tcp::socket socket,
                          std::chrono::milliseconds idle_timeout);

  // Must be called on strand_
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void arm_idle_timer();
  void deliver_disconnect_once();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer idle_timer_;
  const std::chrono::milliseconds idle_timeout_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  boost::asio::streambuf read_buf_;

  LineCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  std::queue<std::shared_ptr<std::string>> send_queue_;
  bool writing_{false};

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_{0};
};

/**
 * RealTransport - boost::asio acceptor plus the I/O threads that serve
 * inbound connections. At most MAX_INBOUND_CONNECTIONS are served at once;
 * further sockets are closed on accept.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(
      size_t io_threads = 1,
      std::chrono::milliseconds idle_timeout = protocol::INBOUND_IDLE_TIMEOUT);
  ~RealTransport() override;

  RealTransport(const RealTransport &) = delete;
  RealTransport &operator=(const RealTransport &) = delete;

  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // Bound port (useful with port 0); 0 if not listening
  uint16_t listening_port() const { return last_listen_port_; }

  size_t connection_count() const;

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);
  void prune_connections_locked();

  // Destroyed only in the destructor so connections never outlive it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_;
  std::chrono::milliseconds idle_timeout_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};

  mutable std::mutex connections_mutex_;
  std::unordered_map<uint64_t, std::weak_ptr<RealTransportConnection>>
      connections_;
};

} // namespace network
} // namespace ziacoin
