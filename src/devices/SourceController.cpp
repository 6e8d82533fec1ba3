/* @file SourceController.cpp
 * @brief grid simulator command sequences (SCPI over LAN)
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <thread>

// ivbench headers
#include "core/Errors.hpp"
#include "devices/SourceController.hpp"

using namespace ivbench::devices;
using ivbench::core::InstrumentFault;
using ivbench::protocols::Command;

namespace {

  // order of the 16 fields in the SOURce:SAFety? reply
  constexpr std::array<const char*, 16> kSafetyLabels{
    "Max RMS Voltage (V)",     "Max Peak Voltage (V)",         "Min Frequency (Hz)",
    "Max Frequency (Hz)",      "Max RMS Current (A)",          "Max Peak Current (A)",
    "Max Voltage Slew (V/us)", "Max Current Slew (A/us)",      "Max Power (W)",
    "Max Apparent Power (VA)", "Max Reactive Power (VAR)",     "Power Factor Limit",
    "Crest Factor Limit",      "Max Harmonics Order",          "Peak Current Limit (A)",
    "Reserved"
  };

  constexpr double kFrequencyTolerance = 0.1; // Hz

} // namespace

SourceController::SourceController(std::unique_ptr<io::InstrumentTransport> transport,
                                   const core::SweepPlan& plan,
                                   std::shared_ptr<core::ErrorMonitor> errorMonitor,
                                   core::Logger& log)
    : session_(kName, std::move(transport), plan.readback, std::move(errorMonitor), log),
      channel_(plan.source.channel), timing_(plan.timing) {}

void SourceController::bringUp(const core::SafetyLimits& limits, double initialVoltage) {
  const auto& policy = session_.policy();
  try {
    session_.connect();

    // protection first, nothing is energized yet
    session_.sendCommand(Command::withValue("INSTrument:NSELect", channel_));
    session_.setConfirmed("SOURce:CURRent", limits.maxCurrent, policy.currentTolerance);
    session_.setConfirmed("SOURce:POWer", limits.maxPower, std::max(1.0, limits.maxPower * 1e-3));
    session_.setConfirmed("SOURce:VOLTage:PROTection", limits.maxVoltage, policy.voltageTolerance);
    session_.setConfirmed("SOURce:FREQuency", limits.frequency, kFrequencyTolerance);
    session_.setMode(SessionMode::Configured);
    logSafetyTable();

    session_.setConfirmed("VOLTage", initialVoltage, policy.voltageTolerance);
    session_.setLastSetpoint(initialVoltage);

    // from here on the output may be live even if confirmation fails
    session_.setMode(SessionMode::Energized);
    session_.sendCommand(Command{ "OUTPut ON" });
    session_.confirmState(Command{ "OUTPut?" }, { "1", "ON" });
    std::this_thread::sleep_for(timing_.outputOn);
  } catch (const InstrumentFault&) {
    session_.setMode(SessionMode::Faulted);
    throw;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "output ON at %.3f V", initialVoltage);
  session_.log().info(kName, buf);
}

double SourceController::setVoltage(double volts) {
  const auto& policy = session_.policy();
  const auto set = Command::withValue("VOLTage", volts);
  std::string last;

  try {
    for (int attempt = 1; attempt <= policy.attempts; ++attempt) {
      try {
        session_.sendCommand(set);
        std::this_thread::sleep_for(timing_.sourceSettle);
        double measured = measureVoltage();
        if (std::fabs(measured - volts) <= policy.voltageTolerance) {
          session_.setLastSetpoint(volts);
          return measured;
        }
        char buf[96];
        std::snprintf(buf, sizeof(buf), "commanded %.3f V, measured %.3f V", volts, measured);
        last = buf;
      } catch (const InstrumentFault& e) {
        last = e.what();
      }
      session_.log().warning(kName, "'" + set.payload + "' attempt " + std::to_string(attempt) +
                                        ": " + last);
      if (attempt < policy.attempts)
        std::this_thread::sleep_for(policy.retryDelay);
    }
    session_.raiseFault("'" + set.payload + "' not reached after " +
                        std::to_string(policy.attempts) + " attempts (" + last + ")");
  } catch (const InstrumentFault&) {
    session_.setMode(SessionMode::Faulted);
    throw;
  }
}

double SourceController::measureVoltage() { return session_.queryNumber(Command{ "MEASure:VOLTage?" }); }

std::vector<std::pair<std::string, std::string>> SourceController::readSafetyTable() {
  auto fields = session_.query(Command{ "SOURce:SAFety?" }).fields();
  std::vector<std::pair<std::string, std::string>> table;
  if (fields.size() != kSafetyLabels.size())
    return table;
  for (std::size_t i = 0; i < fields.size(); ++i)
    table.emplace_back(kSafetyLabels[i], fields[i]);
  return table;
}

void SourceController::logSafetyTable() {
  // informational only: a source that cannot report its table is not a fault
  try {
    auto table = readSafetyTable();
    if (table.empty()) {
      session_.log().warning(kName, "unexpected SOURce:SAFety? reply shape");
      return;
    }
    for (const auto& [label, value] : table) {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "%-28s: %s", label.c_str(), value.c_str());
      session_.log().info(kName, buf);
    }
  } catch (const InstrumentFault& e) {
    session_.log().warning(kName, std::string("safety table unavailable: ") + e.what());
  }
}

void SourceController::bringDown() noexcept {
  if (!session_.linkForShutdown()) {
    // never connected, already brought down, or unreachable
    if (session_.mode() != SessionMode::Uninitialized && session_.mode() != SessionMode::Disabled)
      session_.setMode(SessionMode::Faulted);
    return;
  }

  bool ok = session_.trySend(Command{ "VOLTage 0" });
  std::this_thread::sleep_for(timing_.rampDown);
  ok = session_.trySend(Command{ "OUTPut OFF" }) && ok;
  session_.disconnect();

  session_.setMode(ok ? SessionMode::Disabled : SessionMode::Faulted);
  if (ok)
    session_.log().info(kName, "output OFF, connection closed");
  else
    session_.log().error(kName, "bring-down incomplete, check the source front panel");
}
