#pragma once
/** @file  LoadController.hpp
 *  @brief Bring-up / step / bring-down of the programmable AC electronic load.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <memory>
#include <string>

#include "devices/InstrumentSession.hpp"

namespace ivbench::devices {

  /// One set of load measurements.
  struct LoadReading {
    double voltage{ 0.0 };
    double current{ 0.0 };
    double power{ 0.0 };
  };

  /**
 * @class LoadController
 * @brief Owns the load's InstrumentSession for one run.
 *
 *  * Sink mode is always AC crest-factor (`MODE ACF`). Constant-current mode
 *    oscillates against the grid simulator and is never commanded.
 *  * Bring-up is two-phase: mode/limit configuration, then `LOAD ON`. With the
 *    order reversed the load cannot sense the source voltage.
 *  * Every step sends the RMS target and then the peak-current limit; the
 *    peak command is what makes the load start sinking.
 */
  class LoadController {
  public:
    static constexpr const char* kName = "Load";
    static constexpr const char* kSinkMode = "ACF";
    static constexpr const char* kPeakCurrentHeader = "CURRent:PEAK:MAXimum:AC";

    LoadController(std::unique_ptr<io::InstrumentTransport> transport, const core::SweepPlan& plan,
                   std::shared_ptr<core::ErrorMonitor> errorMonitor, core::Logger& log);

    /// Reset, ACF mode, CF/PF, RMS ceiling, error check, then input on. Throws InstrumentFault.
    void bringUp(const core::SafetyLimits& limits);

    /**
     * @brief RMS target followed by the peak-current trigger, both confirmed.
     * @returns the confirmed RMS setpoint readback.
     * @throws core::InstrumentFault, with "not sinking" in the message when only the
     *         peak trigger failed to confirm.
     */
    double setCurrent(double amps);

    /// MEASure:VOLTage?/CURRent?/POWer? (NaN for unparsable fields).
    LoadReading measure();

    /**
     * @brief LOAD OFF, CURRent 0, *RST, close. Idempotent, never throws.
     *
     * Mode ends Disabled when LOAD OFF went out, Faulted otherwise. The two
     * clean-up commands are attempted either way.
     */
    void bringDown() noexcept;

    /// True once the last setCurrent() confirmed its peak trigger.
    bool sinking() const { return sinking_; }

    SessionMode mode() const { return session_.mode(); }
    const InstrumentSession& session() const { return session_; }

  private:
    void checkErrorQueue();

    InstrumentSession session_;
    core::SafetyLimits limits_;
    core::SweepTiming timing_;
    bool sinking_{ false };
  };

} // namespace ivbench::devices
