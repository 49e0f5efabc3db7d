// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_client.hpp"

#include "util/logging.hpp"

#include <boost/asio.hpp>
#include <istream>

namespace ziacoin {
namespace network {

using tcp = boost::asio::ip::tcp;

RealPeerClient::RealPeerClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::optional<std::string> RealPeerClient::Exchange(const std::string &host,
                                                    uint16_t port,
                                                    const std::string &payload,
                                                    bool expect_reply) {
  boost::asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  boost::asio::streambuf read_buf(protocol::MAX_MESSAGE_SIZE);

  bool done = false;
  boost::system::error_code failure;
  const char *failed_step = nullptr;
  std::string reply;

  auto fail = [&](const char *step, const boost::system::error_code &ec) {
    failed_step = step;
    failure = ec;
  };

  auto on_read = [&](const boost::system::error_code &ec, size_t) {
    if (ec) {
      fail("read", ec);
      return;
    }
    std::istream is(&read_buf);
    std::getline(is, reply);
    done = true;
  };

  auto on_write = [&](const boost::system::error_code &ec, size_t) {
    if (ec) {
      fail("write", ec);
      return;
    }
    if (!expect_reply) {
      boost::system::error_code ignored;
      socket.shutdown(tcp::socket::shutdown_send, ignored);
      done = true;
      return;
    }
    boost::asio::async_read_until(socket, read_buf, '\n', on_read);
  };

  auto on_connect = [&](const boost::system::error_code &ec,
                        const tcp::endpoint &) {
    if (ec) {
      fail("connect", ec);
      return;
    }
    boost::system::error_code opt_ec;
    socket.set_option(tcp::no_delay(true), opt_ec);
    boost::asio::async_write(socket, boost::asio::buffer(payload), on_write);
  };

  resolver.async_resolve(host, std::to_string(port),
                         [&](const boost::system::error_code &ec,
                             tcp::resolver::results_type results) {
                           if (ec) {
                             fail("resolve", ec);
                             return;
                           }
                           boost::asio::async_connect(socket, results,
                                                      on_connect);
                         });

  io.run_for(timeout_);

  if (!done) {
    if (failed_step) {
      LOG_NET_DEBUG("{} to {}:{} failed: {}", failed_step, host, port,
                    failure.message());
    } else {
      LOG_NET_DEBUG("request to {}:{} timed out after {} ms", host, port,
                    timeout_.count());
    }
    boost::system::error_code ignored;
    socket.close(ignored);
    return std::nullopt;
  }
  return reply;
}

std::optional<message::Message>
RealPeerClient::Request(const std::string &host, uint16_t port,
                        const message::Message &request) {
  auto line = Exchange(host, port, message::EncodeMessage(request), true);
  if (!line) {
    return std::nullopt;
  }
  auto reply = message::DecodeMessage(*line);
  if (!reply) {
    LOG_NET_DEBUG("undecodable reply to {} from {}:{}",
                  message::CommandOf(request), host, port);
  }
  return reply;
}

bool RealPeerClient::Send(const std::string &host, uint16_t port,
                          const message::Message &announcement) {
  return Exchange(host, port, message::EncodeMessage(announcement), false)
      .has_value();
}

} // namespace network
} // namespace ziacoin
