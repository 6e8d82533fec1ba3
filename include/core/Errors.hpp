#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the transports, controllers and sweep engine.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

namespace ivbench::core {

  /// Invalid SweepPlan or config file. Always raised before any instrument is contacted.
  class ConfigurationError : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
  };

  /// Communication layer failure (connect, write, read, disconnect).
  class TransportError : public std::runtime_error {
  public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
  };

  /// No reply within the per-command timeout.
  class TransportTimeout : public TransportError {
  public:
    explicit TransportTimeout(const std::string& what) : TransportError(what) {}
  };

  /**
 * @class InstrumentFault
 * @brief Readback mismatch, unexpected instrument state or explicit error reply.
 *
 *  * Transport failures seen by a controller are re-raised as InstrumentFault so the
 *    engine handles a timeout exactly like any other instrument fault.
 */
  class InstrumentFault : public std::runtime_error {
  public:
    InstrumentFault(std::string instrument, const std::string& what)
        : std::runtime_error("[" + instrument + "] " + what), instrument_(std::move(instrument)) {}

    const std::string& instrument() const noexcept { return instrument_; }

  private:
    std::string instrument_;
  };

} // namespace ivbench::core
