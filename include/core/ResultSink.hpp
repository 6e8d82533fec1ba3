#pragma once
/** @file  ResultSink.hpp
 *  @brief Step records, run outcome and the sink the engine hands them to.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ivbench::core {

  enum class StepStatus : std::uint8_t { Ok, Skipped, Faulted };

  inline const char* toString(StepStatus s) {
    switch (s) {
    case StepStatus::Ok:
      return "Ok";
    case StepStatus::Skipped:
      return "Skipped";
    case StepStatus::Faulted:
      return "Faulted";
    default:
      return "Unknown";
    }
  }

  /**
 * @struct StepRecord
 * @brief One V/I grid point: what was commanded and what both instruments read back.
 *
 *  * Measured fields are NaN when the step never got to measure (fault, skip) or a
 *    reply did not parse.
 */
  struct StepRecord {
    std::size_t voltageIndex{ 0 };
    std::size_t currentIndex{ 0 };
    double commandedVoltage{ 0.0 };
    double commandedCurrent{ 0.0 };
    double sourceVoltage{ 0.0 }; ///< source MEASure:VOLTage?
    double loadVoltage{ 0.0 };   ///< load MEASure:VOLTage?
    double loadCurrent{ 0.0 };   ///< load MEASure:CURRent?
    double loadPower{ 0.0 };     ///< load MEASure:POWer?
    std::chrono::system_clock::time_point timestamp{};
    StepStatus status{ StepStatus::Ok };
    std::string note; ///< fault / skip reason, empty when Ok
  };

  /**
 * @struct RunOutcome
 * @brief Terminal state of a run and how far the sweep got.
 */
  struct RunOutcome {
    enum class Status : std::uint8_t { Completed, Aborted, Failed };

    Status status{ Status::Completed };
    std::size_t voltageIndex{ 0 }; ///< last outer index reached
    std::size_t currentIndex{ 0 }; ///< last inner index reached
    std::string reason;            ///< empty when Completed
  };

  inline const char* toString(RunOutcome::Status s) {
    switch (s) {
    case RunOutcome::Status::Completed:
      return "Completed";
    case RunOutcome::Status::Aborted:
      return "Aborted";
    case RunOutcome::Status::Failed:
      return "Failed";
    default:
      return "Unknown";
    }
  }

  /**
 * @class ResultSink
 * @brief Receives records in sweep order, then exactly one finalize().
 *
 *  * Implementations must keep row order and persist every appended record even
 *    when the run ends Aborted or Failed.
 */
  class ResultSink {
  public:
    virtual ~ResultSink() = default;

    virtual void append(const StepRecord& record) = 0;
    virtual void finalize(const RunOutcome& outcome) = 0;
  };

} // namespace ivbench::core
