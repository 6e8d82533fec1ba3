/* @file InstrumentSession.cpp
 * @brief per-instrument command funnel: fault translation, confirm-readback, best-effort sends
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cmath>
#include <limits>
#include <sstream>
#include <thread>

// ivbench headers
#include "core/Errors.hpp"
#include "devices/InstrumentSession.hpp"

using namespace ivbench::devices;
using ivbench::core::InstrumentFault;
using ivbench::core::TransportError;
using ivbench::protocols::Command;
using ivbench::protocols::Response;

InstrumentSession::InstrumentSession(std::string name,
                                     std::unique_ptr<io::InstrumentTransport> transport,
                                     core::ReadbackPolicy policy,
                                     std::shared_ptr<core::ErrorMonitor> errorMonitor,
                                     core::Logger& log)
    : name_(std::move(name)), transport_(std::move(transport)), policy_(policy),
      errorMonitor_(std::move(errorMonitor)), log_(log) {
  assert(transport_ && "[InstrumentSession] transport is nullptr");
  assert(errorMonitor_ && "[InstrumentSession] error monitor is nullptr");
}

InstrumentSession::~InstrumentSession() { disconnect(); }

void InstrumentSession::connect() {
  if (transport_->isOpen())
    return;
  try {
    transport_->open();
  } catch (const TransportError& e) {
    raiseFault(std::string("connect failed: ") + e.what());
  }
  everConnected_ = true;
  log_.info(name_, "connected via " + transport_->describe());
}

void InstrumentSession::disconnect() noexcept {
  if (!transport_->isOpen())
    return;
  try {
    transport_->close();
    log_.debug(name_, "connection closed");
  } catch (const std::exception& e) {
    log_.error(name_, std::string("close failed: ") + e.what());
  }
}

bool InstrumentSession::isConnected() const { return transport_->isOpen(); }

void InstrumentSession::setMode(SessionMode m) {
  if (m != mode_)
    log_.debug(name_, std::string("mode ") + toString(mode_) + " -> " + toString(m));
  mode_ = m;
}

void InstrumentSession::raiseFault(const std::string& what) {
  InstrumentFault fault(name_, what);
  errorMonitor_->notifyFailure(fault.what());
  throw fault;
}

void InstrumentSession::sendCommand(const Command& cmd) {
  try {
    transport_->send(cmd);
  } catch (const TransportError& e) {
    raiseFault("'" + cmd.payload + "' failed: " + e.what());
  }
}

Response InstrumentSession::query(const Command& cmd) {
  try {
    return transport_->query(cmd);
  } catch (const TransportError& e) {
    raiseFault("'" + cmd.payload + "' failed: " + e.what());
  }
}

double InstrumentSession::queryNumber(const Command& cmd) {
  auto reply = query(cmd);
  if (auto v = reply.asNumber())
    return *v;
  log_.warning(name_, "'" + cmd.payload + "' returned non-numeric '" + reply.text + "'");
  return std::numeric_limits<double>::quiet_NaN();
}

void InstrumentSession::pauseBeforeRetry(int attempt) const {
  if (attempt < policy_.attempts)
    std::this_thread::sleep_for(policy_.retryDelay);
}

double InstrumentSession::setConfirmed(const std::string& header, double value, double tolerance) {
  const auto set = Command::withValue(header, value);
  const auto readback = Command::queryOf(header);
  std::string last;

  for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
    try {
      sendCommand(set);
      double got = queryNumber(readback);
      if (std::fabs(got - value) <= tolerance)
        return got;
      std::ostringstream os;
      os << "commanded " << value << ", read back " << got;
      last = os.str();
    } catch (const InstrumentFault& e) {
      last = e.what();
    }
    log_.warning(name_, "'" + set.payload + "' attempt " + std::to_string(attempt) + "/" +
                            std::to_string(policy_.attempts) + ": " + last);
    pauseBeforeRetry(attempt);
  }
  raiseFault("'" + set.payload + "' not confirmed after " + std::to_string(policy_.attempts) +
             " attempts (" + last + ")");
}

void InstrumentSession::confirmState(const Command& q, std::initializer_list<const char*> accepted) {
  std::string last;
  for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
    try {
      auto reply = query(q);
      for (const char* a : accepted) {
        if (reply.text == a)
          return;
      }
      last = "unexpected reply '" + reply.text + "'";
    } catch (const InstrumentFault& e) {
      last = e.what();
    }
    log_.warning(name_, "'" + q.payload + "' attempt " + std::to_string(attempt) + ": " + last);
    pauseBeforeRetry(attempt);
  }
  raiseFault("'" + q.payload + "' not confirmed after " + std::to_string(policy_.attempts) +
             " attempts (" + last + ")");
}

bool InstrumentSession::linkForShutdown() noexcept {
  if (transport_->isOpen())
    return true;
  if (!everConnected_ || mode_ == SessionMode::Disabled)
    return false;

  log_.warning(name_, "link lost while " + std::string(toString(mode_)) + ", reconnecting to shut down");
  try {
    transport_->open();
    return true;
  } catch (const std::exception& e) {
    std::string msg = "[" + name_ + "] reconnect for shutdown failed: " + e.what();
    errorMonitor_->notifyFailure(msg);
    log_.error(name_, msg);
    return false;
  }
}

bool InstrumentSession::trySend(const Command& cmd) noexcept {
  try {
    transport_->send(cmd);
    return true;
  } catch (const std::exception& e) {
    std::string msg = "[" + name_ + "] shutdown command '" + cmd.payload + "' failed: " + e.what();
    errorMonitor_->notifyFailure(msg);
    log_.error(name_, msg);
    return false;
  }
}
