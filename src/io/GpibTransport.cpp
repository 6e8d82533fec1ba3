/* @file GpibTransport.cpp
 * @brief GPIB over a USB-GPIB adapter ("++" controller commands on a tty)
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

// ivbench headers
#include "core/Errors.hpp"
#include "io/GpibTransport.hpp"

using namespace ivbench::io;
using ivbench::core::ConfigurationError;
using ivbench::core::TransportError;
using ivbench::core::TransportTimeout;
using ivbench::protocols::Command;
using ivbench::protocols::Response;

namespace {

  std::vector<std::string> splitOn(const std::string& s, const std::string& sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
      auto pos = s.find(sep, start);
      parts.push_back(s.substr(start, pos == std::string::npos ? pos : pos - start));
      if (pos == std::string::npos)
        break;
      start = pos + sep.size();
    }
    return parts;
  }

  int parseIndex(const std::string& s, const std::string& resource) {
    if (s.empty() || s.size() > 3 || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
      throw ConfigurationError("[GpibAddress] malformed resource string '" + resource + "'");
    return std::stoi(s);
  }

} // namespace

GpibAddress GpibAddress::parse(const std::string& resource) {
  std::string upper = resource;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto parts = splitOn(upper, "::");
  if (parts.size() < 3 || parts.size() > 4 || parts.front().rfind("GPIB", 0) != 0 ||
      parts.back() != "INSTR")
    throw ConfigurationError("[GpibAddress] malformed resource string '" + resource + "'");

  GpibAddress addr;
  auto board = parts.front().substr(4);
  addr.board = board.empty() ? 0 : parseIndex(board, resource);
  addr.primary = parseIndex(parts[1], resource);
  if (parts.size() == 4)
    addr.secondary = parseIndex(parts[2], resource);

  if (addr.primary > 30)
    throw ConfigurationError("[GpibAddress] primary address out of range in '" + resource + "'");
  if (addr.secondary > 30)
    throw ConfigurationError("[GpibAddress] secondary address out of range in '" + resource + "'");
  return addr;
}

GpibTransport::GpibTransport(std::string resource, std::string controllerDevice,
                             std::chrono::milliseconds timeout,
                             std::unique_ptr<SerialChannel> channel)
    : resource_(std::move(resource)), controllerDevice_(std::move(controllerDevice)),
      address_(GpibAddress::parse(resource_)), timeout_(timeout), channel_(std::move(channel)) {}

void GpibTransport::open() {
  if (channel_->isOpen())
    return;
  if (!channel_->open(controllerDevice_, kControllerBaud))
    throw TransportError("[GpibTransport] cannot open controller " + controllerDevice_ + " for " +
                         resource_);

  // controller mode, explicit reads, assert EOI on last byte, LF appended to commands
  writeRaw("++mode 1");
  writeRaw("++auto 0");
  writeRaw("++eoi 1");
  writeRaw("++eos 2");
  writeRaw("++read_tmo_ms " + std::to_string(std::clamp<long long>(timeout_.count(), 1, 3000)));
  std::string addr = "++addr " + std::to_string(address_.primary);
  if (address_.secondary >= 0)
    addr += " " + std::to_string(96 + address_.secondary);
  writeRaw(addr);
  // device clear so a half-finished reply from a previous run cannot leak into ours
  writeRaw("++clr");
  channel_->discardInput();
}

void GpibTransport::close() { channel_->close(); }

void GpibTransport::writeRaw(const std::string& line) {
  if (!channel_->writeLine(line))
    throw TransportError("[GpibTransport] write of '" + line + "' to " + controllerDevice_ +
                         " failed");
}

void GpibTransport::send(const Command& cmd) {
  if (!channel_->isOpen())
    throw TransportError("[GpibTransport] " + resource_ + " not open");
  writeRaw(cmd.payload);
}

Response GpibTransport::query(const Command& cmd, std::chrono::milliseconds timeout) {
  channel_->discardInput();
  send(cmd);
  writeRaw("++read eoi");
  auto line = channel_->readLine(timeout);
  if (!line) {
    if (!channel_->isOpen())
      throw TransportError("[GpibTransport] controller " + controllerDevice_ + " disconnected");
    resync();
    throw TransportTimeout("[GpibTransport] no reply to '" + cmd.payload + "' from " + resource_ +
                           " within " + std::to_string(timeout.count()) + " ms");
  }
  auto response = Response::fromWire(*line);
  if (!response)
    throw TransportError("[GpibTransport] empty reply to '" + cmd.payload + "'");
  return *response;
}

void GpibTransport::resync() {
  // device clear empties the instrument's output queue, so the reply we gave up
  // on is never handed to the next ++read
  if (!channel_->writeLine("++clr"))
    std::cerr << "[GpibTransport] device clear of " << resource_ << " after timeout failed\n";
  channel_->discardInput();
}
