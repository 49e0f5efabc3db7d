// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/real_transport.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <istream>

namespace ziacoin {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

std::shared_ptr<RealTransportConnection> RealTransportConnection::create_inbound(
    boost::asio::io_context &io_context, boost::asio::ip::tcp::socket socket,
    std::chrono::milliseconds idle_timeout) {
  return std::shared_ptr<RealTransportConnection>(new RealTransportConnection(
      io_context, std::move(socket), idle_timeout));
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, boost::asio::ip::tcp::socket socket,
    std::chrono::milliseconds idle_timeout)
    : io_context_(io_context), socket_(std::move(socket)),
      strand_(io_context.get_executor()), idle_timer_(io_context),
      idle_timeout_(idle_timeout), id_(next_id_++),
      read_buf_(protocol::MAX_MESSAGE_SIZE) {
  open_ = socket_.is_open();

  boost::system::error_code ec;
  auto remote_ep = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_addr_ = remote_ep.address().to_string();
    remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_) {
      return;
    }
    self->arm_idle_timer();
    self->start_read_impl();
  });
}

void RealTransportConnection::arm_idle_timer() {
  if (idle_timeout_.count() <= 0) {
    return;
  }
  idle_timer_.expires_after(idle_timeout_);
  idle_timer_.async_wait(boost::asio::bind_executor(
      strand_, [this, self = shared_from_this()](
                   const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || !open_) {
          return;
        }
        LOG_NET_DEBUG("closing idle connection {}:{}", remote_addr_,
                      remote_port_);
        close_impl();
      }));
}

void RealTransportConnection::start_read_impl() {
  if (!open_) {
    return;
  }

  boost::asio::async_read_until(
      socket_, read_buf_, '\n',
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this()](
                       const boost::system::error_code &ec, size_t) {
            if (!open_) {
              return;
            }

            if (ec) {
              if (ec == boost::asio::error::not_found) {
                LOG_NET_WARN("frame from {}:{} exceeds {} bytes, disconnecting",
                             remote_addr_, remote_port_,
                             protocol::MAX_MESSAGE_SIZE);
              } else if (ec != boost::asio::error::eof &&
                         ec != boost::asio::error::operation_aborted) {
                LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
              }
              close_impl();
              return;
            }

            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if (!line.empty() && line.back() == '\r') {
              line.pop_back();
            }

            arm_idle_timer();

            if (!line.empty() && receive_callback_) {
              LOG_NET_TRACE("received {} bytes from {}:{}", line.size(),
                            remote_addr_, remote_port_);
              try {
                receive_callback_(line);
              } catch (const std::exception &e) {
                LOG_NET_ERROR("exception handling frame from {}:{}: {}",
                              remote_addr_, remote_port_, e.what());
                close_impl();
                return;
              }
            }

            if (!open_) {
              return;
            }
            start_read_impl();
          }));
}

bool RealTransportConnection::send(const std::string &line) {
  if (!open_) {
    return false;
  }
  auto payload = std::make_shared<std::string>(line);
  if (payload->empty() || payload->back() != '\n') {
    payload->push_back('\n');
  }
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) {
      return;
    }
    send_queue_.push(payload);
    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_) {
    return;
  }
  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data = send_queue_.front();
  boost::asio::async_write(
      socket_, boost::asio::buffer(*data),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(),
                    data](const boost::system::error_code &ec, size_t) {
            if (!open_) {
              return;
            }
            if (ec) {
              LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_,
                            remote_port_, ec.message());
              close_impl();
              return;
            }
            send_queue_.pop();
            do_write_impl();
          }));
}

void RealTransportConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (cb) {
    // Off the strand so the callback may call back into this connection
    boost::asio::post(io_context_, [cb = std::move(cb), id = id_]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback for connection {}: {}",
                      id, e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_,
                        [this, self = shared_from_this()]() { close_impl(); });
}

void RealTransportConnection::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  idle_timer_.cancel();

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  std::queue<std::shared_ptr<std::string>> empty;
  std::swap(send_queue_, empty);
  writing_ = false;
  receive_callback_ = {};

  deliver_disconnect_once();
}

void RealTransportConnection::set_receive_callback(LineCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(size_t io_threads,
                             std::chrono::milliseconds idle_timeout)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads),
      idle_timeout_(idle_timeout) {}

RealTransport::~RealTransport() { stop(); }

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    // Dual-stack first, IPv4-only if the host has no IPv6
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const boost::system::system_error &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    last_listen_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("listening on port {}",
                 last_listen_port_ ? last_listen_port_ : port);
    start_accept();
    return true;

  } catch (const boost::system::system_error &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void RealTransport::start_accept() {
  if (!acceptor_) {
    return;
  }
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::prune_connections_locked() {
  for (auto it = connections_.begin(); it != connections_.end();) {
    auto conn = it->second.lock();
    if (!conn || !conn->is_open()) {
      it = connections_.erase(it);
    } else {
      ++it;
    }
  }
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

  auto conn = RealTransportConnection::create_inbound(
      *io_context_, std::move(socket), idle_timeout_);

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    prune_connections_locked();
    if (connections_.size() >= protocol::MAX_INBOUND_CONNECTIONS) {
      LOG_NET_WARN("inbound connection limit reached, rejecting {}:{}",
                   conn->remote_address(), conn->remote_port());
      conn->close();
      start_accept();
      return;
    }
    connections_[conn->connection_id()] = conn;
  }

  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(),
                conn->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(conn);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
      conn->close();
    }
  }

  start_accept();
}

size_t RealTransport::connection_count() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  size_t n = 0;
  for (const auto &[id, weak] : connections_) {
    auto conn = weak.lock();
    if (conn && conn->is_open()) {
      ++n;
    }
  }
  return n;
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  accept_callback_ = {};
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void RealTransport::stop() {
  running_.store(false);

  // No logging: also reached from the destructor during shutdown
  stop_listening();

  std::vector<std::shared_ptr<RealTransportConnection>> open;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto &[id, weak] : connections_) {
      if (auto conn = weak.lock()) {
        open.push_back(std::move(conn));
      }
    }
    connections_.clear();
  }
  for (auto &conn : open) {
    conn->close();
  }
  open.clear();

  work_guard_.reset();
  io_context_->stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace ziacoin
