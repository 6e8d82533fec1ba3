#pragma once
/** @file  InstrumentTransport.hpp
 *  @brief Abstract command/reply channel to one instrument.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

// ivbench headers
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace ivbench::io {

  /**
 * @class InstrumentTransport
 * @brief Blocking send/query seam the controllers talk through.
 *
 *  * `send()` raises core::TransportError when the command cannot be written.
 *  * `query()` raises core::TransportTimeout when no reply arrives in time and
 *    core::TransportError on any other failure (including an empty reply).
 *  * One caller at a time; no internal locking.
 */
  class InstrumentTransport {
  public:
    virtual ~InstrumentTransport() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual void send(const protocols::Command& cmd) = 0;
    virtual protocols::Response query(const protocols::Command& cmd,
                                      std::chrono::milliseconds timeout) = 0;
    protocols::Response query(const protocols::Command& cmd) {
      return query(cmd, defaultTimeout());
    }

    /// Human readable address ("192.168.0.149:5025", "GPIB0::8::INSTR").
    virtual std::string describe() const = 0;

    virtual std::chrono::milliseconds defaultTimeout() const = 0;
  };

} // namespace ivbench::io
