#pragma once

/** @file  SweepEngine.hpp
 *  @brief Nested V/I sweep state machine with a guaranteed shutdown phase.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/AbortMonitor.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ResultSink.hpp"
#include "core/SweepPlan.hpp"
#include "devices/LoadController.hpp"
#include "devices/SourceController.hpp"

namespace ivbench {
  namespace core {

    /// What run() hands back once the instruments are safe.
    struct RunResult {
      RunOutcome outcome;
      std::vector<StepRecord> records; ///< same rows, same order as the sink received
    };

    /**
 * @class SweepEngine
 * @brief Idle -> SourceUp -> LoadUp -> Sweeping -> ShuttingDown -> Done.
 *
 *  * Owns both controllers exclusively for the duration of run().
 *  * ShuttingDown is entered from every path, exceptions included: load off
 *    first, then source off, each attempted regardless of the other.
 *  * Single-shot: a second run() throws std::logic_error.
 */
    class SweepEngine {

    public:
      enum class State : std::uint8_t { Idle, SourceUp, LoadUp, Sweeping, ShuttingDown, Done };

      SweepEngine(SweepPlan plan, devices::SourceController& source, devices::LoadController& load,
                  std::shared_ptr<ErrorMonitor> errorMonitor, Logger& log);

      //---public API-----------------------------------------------------
      RunResult run(const AbortMonitor& abort, ResultSink& sink);

      State state() const { return state_; }
      const SweepPlan& plan() const { return plan_; }

    private:
      void transitionTo(State next);
      void sweep(const AbortMonitor& abort, ResultSink& sink, RunOutcome& outcome);
      void emit(ResultSink& sink, StepRecord record);
      void shutDown(ResultSink& sink, const RunOutcome& outcome) noexcept;

      SweepPlan plan_;
      devices::SourceController& source_;
      devices::LoadController& load_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Logger& log_;

      State state_{ State::Idle };
      std::vector<StepRecord> records_;
    };

    const char* toString(SweepEngine::State s);

  } // namespace core
} // namespace ivbench
