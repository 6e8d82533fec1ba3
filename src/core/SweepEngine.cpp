/* @file SweepEngine.cpp
 * @brief sweep state machine; shutdown runs on every exit path
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

// ivbench headers
#include "core/Errors.hpp"
#include "core/SweepEngine.hpp"

using namespace ivbench::core;
using ivbench::devices::SessionMode;

namespace {

  constexpr const char* kTag = "SweepEngine";
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

const char* ivbench::core::toString(SweepEngine::State s) {
  switch (s) {
  case SweepEngine::State::Idle:
    return "Idle";
  case SweepEngine::State::SourceUp:
    return "SourceUp";
  case SweepEngine::State::LoadUp:
    return "LoadUp";
  case SweepEngine::State::Sweeping:
    return "Sweeping";
  case SweepEngine::State::ShuttingDown:
    return "ShuttingDown";
  case SweepEngine::State::Done:
    return "Done";
  default:
    return "Unknown";
  }
}

SweepEngine::SweepEngine(SweepPlan plan, devices::SourceController& source,
                         devices::LoadController& load, std::shared_ptr<ErrorMonitor> errorMonitor,
                         Logger& log)
    : plan_(std::move(plan)), source_(source), load_(load), errorMonitor_(std::move(errorMonitor)),
      log_(log) {
  if (!errorMonitor_)
    throw std::invalid_argument("[SweepEngine] error monitor is nullptr");
  plan_.validate();
}

void SweepEngine::transitionTo(State next) {
  log_.debug(kTag, std::string(toString(state_)) + " -> " + toString(next));
  state_ = next;
}

RunResult SweepEngine::run(const AbortMonitor& abort, ResultSink& sink) {
  if (state_ != State::Idle)
    throw std::logic_error("[SweepEngine] run() is single-shot");

  RunOutcome outcome;
  try {
    transitionTo(State::SourceUp);
    source_.bringUp(plan_.limits, plan_.voltage.start);

    transitionTo(State::LoadUp);
    load_.bringUp(plan_.limits);

    transitionTo(State::Sweeping);
    sweep(abort, sink, outcome);
  } catch (const InstrumentFault& e) {
    outcome.status = RunOutcome::Status::Failed;
    outcome.reason = e.what();
  } catch (const std::exception& e) {
    // sink I/O or anything else below us: still a failed run, still shut down
    outcome.status = RunOutcome::Status::Failed;
    outcome.reason = std::string("[SweepEngine] ") + e.what();
    errorMonitor_->notifyFailure(outcome.reason);
  }

  transitionTo(State::ShuttingDown);
  shutDown(sink, outcome);
  transitionTo(State::Done);

  std::string summary = std::string("run ") + toString(outcome.status) + " after " +
                        std::to_string(records_.size()) + " step(s)";
  if (!outcome.reason.empty())
    summary += ": " + outcome.reason;
  log_.log(outcome.status == RunOutcome::Status::Completed ? Severity::Info : Severity::Warning, kTag,
           summary);

  return RunResult{ outcome, records_ };
}

void SweepEngine::sweep(const AbortMonitor& abort, ResultSink& sink, RunOutcome& outcome) {
  const auto volts = plan_.voltage.values();
  const auto amps = plan_.current.values();
  const std::size_t total = volts.size() * amps.size();
  char buf[192];

  for (std::size_t vi = 0; vi < volts.size(); ++vi) {
    outcome.voltageIndex = vi;
    outcome.currentIndex = 0;

    double measured = source_.setVoltage(volts[vi]);
    std::snprintf(buf, sizeof(buf), "voltage %zu/%zu: set %.3f %s, measured %.3f V", vi + 1,
                  volts.size(), volts[vi], plan_.voltage.unit.c_str(), measured);
    log_.info(kTag, buf);

    if (abort.abortRequested()) {
      outcome.status = RunOutcome::Status::Aborted;
      outcome.reason = abort.reason();
      return;
    }

    for (std::size_t ci = 0; ci < amps.size(); ++ci) {
      outcome.currentIndex = ci;

      StepRecord rec;
      rec.voltageIndex = vi;
      rec.currentIndex = ci;
      rec.commandedVoltage = volts[vi];
      rec.commandedCurrent = amps[ci];
      rec.sourceVoltage = rec.loadVoltage = rec.loadCurrent = rec.loadPower = kNaN;

      try {
        load_.setCurrent(amps[ci]);

        if (abort.waitFor(plan_.timing.settle)) {
          rec.status = StepStatus::Skipped;
          rec.note = "settle interrupted: " + abort.reason();
          rec.timestamp = std::chrono::system_clock::now();
          emit(sink, std::move(rec));
          outcome.status = RunOutcome::Status::Aborted;
          outcome.reason = abort.reason();
          return;
        }

        rec.sourceVoltage = source_.measureVoltage();
        auto reading = load_.measure();
        rec.loadVoltage = reading.voltage;
        rec.loadCurrent = reading.current;
        rec.loadPower = reading.power;
      } catch (const InstrumentFault& e) {
        rec.status = StepStatus::Faulted;
        rec.note = e.what();
        rec.timestamp = std::chrono::system_clock::now();
        emit(sink, std::move(rec));
        outcome.status = RunOutcome::Status::Failed;
        outcome.reason = e.what();
        return;
      }

      rec.timestamp = std::chrono::system_clock::now();
      std::snprintf(buf, sizeof(buf),
                    "step %zu/%zu: %.3f V / %.3f A -> source %.3f V, load %.3f V %.3f A %.3f W",
                    records_.size() + 1, total, rec.commandedVoltage, rec.commandedCurrent,
                    rec.sourceVoltage, rec.loadVoltage, rec.loadCurrent, rec.loadPower);
      log_.info(kTag, buf);
      emit(sink, std::move(rec));

      if (abort.abortRequested()) {
        outcome.status = RunOutcome::Status::Aborted;
        outcome.reason = abort.reason();
        return;
      }
    }
  }
  outcome.status = RunOutcome::Status::Completed;
}

void SweepEngine::emit(ResultSink& sink, StepRecord record) {
  sink.append(record);
  records_.push_back(std::move(record));
}

void SweepEngine::shutDown(ResultSink& sink, const RunOutcome& outcome) noexcept {
  // load stops sinking before the source ramps down
  load_.bringDown();
  source_.bringDown();

  if (load_.mode() == SessionMode::Energized || source_.mode() == SessionMode::Energized)
    log_.error(kTag, "an instrument still reports Energized after shutdown");

  try {
    sink.finalize(outcome);
  } catch (const std::exception& e) {
    std::string msg = std::string("[SweepEngine] result sink finalize failed: ") + e.what();
    errorMonitor_->notifyFailure(msg);
    log_.error(kTag, msg);
  }
}
