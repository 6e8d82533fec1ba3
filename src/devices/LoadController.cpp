/* @file LoadController.cpp
 * @brief electronic load command sequences (SCPI over GPIB)
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdio>
#include <thread>

// ivbench headers
#include "core/Errors.hpp"
#include "devices/LoadController.hpp"

using namespace ivbench::devices;
using ivbench::core::InstrumentFault;
using ivbench::protocols::Command;

namespace {

  constexpr double kFactorTolerance = 0.01;

  bool noError(const std::string& reply) {
    return reply == "0" || reply == "OK" || reply.rfind("0,", 0) == 0;
  }

} // namespace

LoadController::LoadController(std::unique_ptr<io::InstrumentTransport> transport,
                               const core::SweepPlan& plan,
                               std::shared_ptr<core::ErrorMonitor> errorMonitor, core::Logger& log)
    : session_(kName, std::move(transport), plan.readback, std::move(errorMonitor), log),
      limits_(plan.limits), timing_(plan.timing) {}

void LoadController::bringUp(const core::SafetyLimits& limits) {
  const auto& policy = session_.policy();
  limits_ = limits;
  sinking_ = false;
  try {
    session_.connect();

    session_.sendCommand(Command{ "*RST" });
    std::this_thread::sleep_for(timing_.loadReset);
    session_.sendCommand(Command{ "*CLS" });

    // phase (a): mode and limits while the input is still off
    session_.sendCommand(Command{ std::string("MODE ") + kSinkMode });
    session_.confirmState(Command{ "MODE?" }, { kSinkMode });
    session_.setConfirmed("CFACTor", limits.crestFactor, kFactorTolerance);
    session_.setConfirmed("PFACtor", limits.powerFactor, kFactorTolerance);
    session_.setConfirmed("CURRent:MAXimum:AC", limits.maxCurrent, policy.currentTolerance);
    checkErrorQueue();
    session_.log().info(kName, "identity: " + session_.query(Command{ "*IDN?" }).text);
    session_.setMode(SessionMode::Configured);

    // phase (b): enable input
    session_.setMode(SessionMode::Energized);
    session_.sendCommand(Command{ "LOAD ON" });
    session_.confirmState(Command{ "LOAD:STATus?" }, { "1", "ON" });
  } catch (const InstrumentFault&) {
    session_.setMode(SessionMode::Faulted);
    throw;
  }
  session_.log().info(kName, "input ON in ACF mode");
}

void LoadController::checkErrorQueue() {
  auto reply = session_.query(Command{ "SYSTem:ERRor?" }).text;
  if (!noError(reply))
    session_.raiseFault("load reported an error during setup: " + reply);
}

double LoadController::setCurrent(double amps) {
  const auto& policy = session_.policy();
  const double peak = limits_.peakCurrentFor(amps);
  const auto rms = Command::withValue("CURR", amps);
  const auto trigger = Command::withValue(kPeakCurrentHeader, peak);
  std::string last;
  bool peakMissing = false;

  sinking_ = false;
  try {
    for (int attempt = 1; attempt <= policy.attempts; ++attempt) {
      try {
        // the pair must go out back to back on every step
        session_.sendCommand(rms);
        session_.sendCommand(trigger);

        double rmsBack = session_.queryNumber(Command{ "CURRent?" });
        double peakBack = session_.queryNumber(Command::queryOf(kPeakCurrentHeader));
        bool rmsOk = std::fabs(rmsBack - amps) <= policy.currentTolerance;
        bool peakOk = std::fabs(peakBack - peak) <= policy.currentTolerance;
        if (rmsOk && peakOk) {
          session_.setLastSetpoint(amps);
          sinking_ = true;
          return rmsBack;
        }

        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "commanded %.3f A rms / %.3f A peak, read back %.3f A rms / %.3f A peak",
                      amps, peak, rmsBack, peakBack);
        last = buf;
        peakMissing = rmsOk && !peakOk;
      } catch (const InstrumentFault& e) {
        last = e.what();
        peakMissing = false;
      }
      session_.log().warning(kName, "step attempt " + std::to_string(attempt) + ": " + last);
      if (attempt < policy.attempts)
        std::this_thread::sleep_for(policy.retryDelay);
    }

    if (peakMissing)
      session_.raiseFault("peak-current trigger not confirmed, load is not sinking (" + last + ")");
    session_.raiseFault("current step not confirmed after " + std::to_string(policy.attempts) +
                        " attempts (" + last + ")");
  } catch (const InstrumentFault&) {
    session_.setMode(SessionMode::Faulted);
    throw;
  }
}

LoadReading LoadController::measure() {
  LoadReading r;
  r.voltage = session_.queryNumber(Command{ "MEASure:VOLTage?" });
  r.current = session_.queryNumber(Command{ "MEASure:CURRent?" });
  r.power = session_.queryNumber(Command{ "MEASure:POWer?" });
  return r;
}

void LoadController::bringDown() noexcept {
  sinking_ = false;
  if (!session_.linkForShutdown()) {
    if (session_.mode() != SessionMode::Uninitialized && session_.mode() != SessionMode::Disabled)
      session_.setMode(SessionMode::Faulted);
    return;
  }

  bool ok = session_.trySend(Command{ "LOAD OFF" });
  // leave no setpoint, peak trigger or ACF setup behind for the next run
  bool cleared = session_.trySend(Command{ "CURRent 0" });
  cleared = session_.trySend(Command{ "*RST" }) && cleared;
  session_.disconnect();

  session_.setMode(ok ? SessionMode::Disabled : SessionMode::Faulted);
  if (!ok)
    session_.log().error(kName, "bring-down incomplete, check the load front panel");
  else if (!cleared)
    session_.log().warning(kName, "input OFF, but the load was not reset");
  else
    session_.log().info(kName, "input OFF, load reset, connection closed");
}
