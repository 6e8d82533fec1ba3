#pragma once
/** @file  SweepPlan.hpp
 *  @brief Immutable description of one nested V/I sweep run.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ivbench::core {

  /**
 * @struct SweepRange
 * @brief start/stop/step triple, inclusive of stop when a step lands on it.
 *
 *  * `step` must be non-zero and point from start towards stop.
 *  * `start == stop` yields exactly one value.
 */
  struct SweepRange {
    double start{ 0.0 };
    double stop{ 0.0 };
    double step{ 1.0 };
    std::string unit;

    /// Values in visiting order. Throws ConfigurationError if the range is invalid.
    std::vector<double> values() const;
    std::size_t count() const { return values().size(); }
  };

  /// Protection settings for both instruments.
  struct SafetyLimits {
    double maxVoltage{ 300.0 };    ///< V rms, source protection
    double maxCurrent{ 20.0 };     ///< A rms, source limit and load ceiling
    double maxPower{ 2500.0 };     ///< W, source power limit
    double frequency{ 60.0 };      ///< Hz, source output frequency
    double crestFactor{ 1.414 };   ///< load CF
    double powerFactor{ 1.0 };     ///< load PF
    double peakFactor{ 1.5 };      ///< peak-current trigger = rms * peakFactor
    double minPeakCurrent{ 0.1 };  ///< peak trigger used for a 0 A step

    /// Peak-current trigger value the load gets for an rms target.
    double peakCurrentFor(double rms) const { return rms > 0.0 ? rms * peakFactor : minPeakCurrent; }
  };

  /// Confirm-readback policy for every set command.
  struct ReadbackPolicy {
    int attempts{ 3 };
    double voltageTolerance{ 0.5 }; ///< V
    double currentTolerance{ 0.1 }; ///< A
    std::chrono::milliseconds retryDelay{ 200 };
  };

  /// Delays the instruments need between commands.
  struct SweepTiming {
    std::chrono::milliseconds settle{ 20000 };      ///< per V/I step, before measuring
    std::chrono::milliseconds sourceSettle{ 1500 }; ///< after a voltage change
    std::chrono::milliseconds outputOn{ 2000 };     ///< after OUTPut ON
    std::chrono::milliseconds rampDown{ 1000 };     ///< between VOLTage 0 and OUTPut OFF
    std::chrono::milliseconds loadReset{ 2000 };    ///< after *RST on the load
  };

  struct SourceAddress {
    std::string host;
    std::uint16_t port{ 5025 };
    int channel{ 3 }; ///< INSTrument:NSELect
    std::chrono::milliseconds timeout{ 10000 };
  };

  struct LoadAddress {
    std::string resource;   ///< GPIB0::8::INSTR
    std::string controller; ///< USB-GPIB adapter tty
    std::chrono::milliseconds timeout{ 5000 };
  };

  /**
 * @struct SweepPlan
 * @brief Everything a run needs, fixed before the first instrument command.
 *
 *  * Built once (from JSON or in code), validated, then passed by value into
 *    the engine. There is no mid-run reconfiguration.
 */
  struct SweepPlan {
    SourceAddress source;
    LoadAddress load;
    SweepRange voltage{ 100.0, 150.0, 25.0, "V" };
    SweepRange current{ 0.0, 10.0, 2.5, "A" };
    SafetyLimits limits;
    ReadbackPolicy readback;
    SweepTiming timing;
    char abortKey{ 'q' };

    /// Throws ConfigurationError describing the first violated constraint.
    void validate() const;

    /// Parse + validate. Throws ConfigurationError on schema or invariant errors.
    static SweepPlan fromJson(const nlohmann::json& j);

    /// Peak-current trigger value the load gets for an rms target.
    double peakCurrentFor(double rms) const { return limits.peakCurrentFor(rms); }
  };

} // namespace ivbench::core
