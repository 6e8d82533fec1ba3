#pragma once
/** @file  SourceController.hpp
 *  @brief Bring-up / step / bring-down of the programmable AC/DC grid simulator.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "devices/InstrumentSession.hpp"

namespace ivbench::devices {

  /**
 * @class SourceController
 * @brief Owns the source's InstrumentSession for one run.
 *
 *  * `bringUp()`   Uninitialized -> Configured -> Energized.
 *  * `setVoltage()` commands + confirms, returns the measured voltage.
 *  * `bringDown()` ramps to 0 V, disables output, closes the link. Never throws.
 */
  class SourceController {
  public:
    static constexpr const char* kName = "Source";

    SourceController(std::unique_ptr<io::InstrumentTransport> transport, const core::SweepPlan& plan,
                     std::shared_ptr<core::ErrorMonitor> errorMonitor, core::Logger& log);

    /// Protection limits + frequency, initial voltage, output on. Throws InstrumentFault.
    void bringUp(const core::SafetyLimits& limits, double initialVoltage);

    /// @returns measured output voltage once within tolerance. Throws InstrumentFault.
    double setVoltage(double volts);

    /// MEASure:VOLTage? (NaN if unparsable). Throws InstrumentFault on I/O failure.
    double measureVoltage();

    /// Idempotent; safe from any mode.
    void bringDown() noexcept;

    /// SOURce:SAFety? as (label, text) pairs; empty if the reply has an unexpected shape.
    std::vector<std::pair<std::string, std::string>> readSafetyTable();

    SessionMode mode() const { return session_.mode(); }
    const InstrumentSession& session() const { return session_; }

  private:
    void logSafetyTable();

    InstrumentSession session_;
    int channel_;
    core::SweepTiming timing_;
  };

} // namespace ivbench::devices
