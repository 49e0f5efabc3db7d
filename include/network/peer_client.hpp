// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ziacoin {
namespace network {

/**
 * PeerClient - outbound requests to other nodes.
 *
 * Each call opens its own connection, so calls from different threads never
 * share state. Failures (resolve, connect, write, read, timeout, an
 * undecodable reply) are reported as nullopt/false and logged at debug level;
 * callers decide what a failure means for the peer.
 */
class PeerClient {
public:
  virtual ~PeerClient() = default;

  // Send a request and wait for exactly one reply line
  virtual std::optional<message::Message>
  Request(const std::string &host, uint16_t port,
          const message::Message &request) = 0;

  // Deliver an announcement (new_block / new_transaction); no reply expected
  virtual bool Send(const std::string &host, uint16_t port,
                    const message::Message &announcement) = 0;
};

/**
 * RealPeerClient - PeerClient over TCP with boost::asio.
 *
 * Every call runs resolve -> connect -> write (-> read_until '\n') on a
 * private io_context under one deadline (io_context::run_for). Pending
 * operations are abandoned when the deadline passes.
 */
class RealPeerClient : public PeerClient {
public:
  explicit RealPeerClient(
      std::chrono::milliseconds timeout = protocol::REQUEST_TIMEOUT);

  std::optional<message::Message>
  Request(const std::string &host, uint16_t port,
          const message::Message &request) override;

  bool Send(const std::string &host, uint16_t port,
            const message::Message &announcement) override;

private:
  // Returns the reply line when expect_reply, an empty string on a
  // successful send otherwise; nullopt on any failure
  std::optional<std::string> Exchange(const std::string &host, uint16_t port,
                                      const std::string &payload,
                                      bool expect_reply);

  const std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace ziacoin
