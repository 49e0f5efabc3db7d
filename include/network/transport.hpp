// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ziacoin {
namespace network {

// Abstract inbound transport. Connections exchange newline-delimited text
// frames; the transport owns framing and size limits, callers see whole
// lines. Outbound requests go through PeerClient instead.
//
// Implementations:
// - RealTransport: TCP sockets via boost::asio

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// One complete frame without its trailing '\n'
using LineCallback = std::function<void(const std::string &line)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Begin reading. Set callbacks first.
  virtual void start() = 0;

  // Queue one frame; '\n' is appended if missing.
  // Returns false only if the connection is already closed.
  virtual bool send(const std::string &line) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(LineCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

class Transport {
public:
  virtual ~Transport() = default;

  // Start accepting inbound connections (true if listening started)
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Start the I/O threads (returns immediately)
  virtual void run() = 0;

  // Close all connections, stop listening, join I/O threads
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace ziacoin
