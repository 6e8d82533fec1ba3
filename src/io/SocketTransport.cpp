/* @file SocketTransport.cpp
 * @brief SCPI over TCP: one line out, one line back
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// ivbench headers
#include "core/Errors.hpp"
#include "io/SocketTransport.hpp"

using namespace ivbench::io;
using ivbench::core::TransportError;
using ivbench::core::TransportTimeout;
using ivbench::protocols::Command;
using ivbench::protocols::Response;

SocketTransport::SocketTransport(std::string host, std::uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 std::unique_ptr<SocketChannel> channel)
    : host_(std::move(host)), port_(port), timeout_(timeout), channel_(std::move(channel)) {}

void SocketTransport::open() {
  if (channel_->isOpen())
    return;
  if (!channel_->open(host_, port_, timeout_))
    throw TransportError("[SocketTransport] connect to " + describe() + " failed");
}

void SocketTransport::close() { channel_->close(); }

void SocketTransport::send(const Command& cmd) {
  if (!channel_->isOpen())
    throw TransportError("[SocketTransport] " + describe() + " not connected");
  if (!channel_->writeLine(cmd.payload))
    throw TransportError("[SocketTransport] write of '" + cmd.payload + "' to " + describe() +
                         " failed");
}

Response SocketTransport::query(const Command& cmd, std::chrono::milliseconds timeout) {
  // every reply read below must belong to this query
  channel_->discardInput();
  send(cmd);
  auto line = channel_->readLine(timeout);
  if (!line) {
    if (!channel_->isOpen())
      throw TransportError("[SocketTransport] " + describe() + " closed the connection");
    resync();
    throw TransportTimeout("[SocketTransport] no reply to '" + cmd.payload + "' from " +
                           describe() + " within " + std::to_string(timeout.count()) + " ms");
  }
  auto response = Response::fromWire(*line);
  if (!response)
    throw TransportError("[SocketTransport] empty reply to '" + cmd.payload + "'");
  return *response;
}

void SocketTransport::resync() {
  // the timed-out reply may still arrive; a fresh connection can never deliver it
  channel_->close();
  if (!channel_->open(host_, port_, timeout_))
    std::cerr << "[SocketTransport] reconnect to " << describe() << " after timeout failed\n";
}

std::string SocketTransport::describe() const { return host_ + ":" + std::to_string(port_); }
