#pragma once
/** @file  InstrumentSession.hpp
 *  @brief One live connection to one instrument: transport, mode, last setpoint.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

// ivbench headers
#include "core/ErrorMonitor.hpp" // session reports every fault to the monitor
#include "core/Logger.hpp"
#include "core/SweepPlan.hpp"         // ReadbackPolicy
#include "io/InstrumentTransport.hpp" // session owns its transport

namespace ivbench {
  namespace devices {

    enum class SessionMode : std::uint8_t { Uninitialized, Configured, Energized, Disabled, Faulted };

    inline const char* toString(SessionMode m) {
      switch (m) {
      case SessionMode::Uninitialized:
        return "Uninitialized";
      case SessionMode::Configured:
        return "Configured";
      case SessionMode::Energized:
        return "Energized";
      case SessionMode::Disabled:
        return "Disabled";
      case SessionMode::Faulted:
        return "Faulted";
      default:
        return "Unknown";
      }
    }

    /**
 * @class InstrumentSession
 * @brief Funnel for all I/O to one instrument.
 *
 *  * Transport errors come out as core::InstrumentFault tagged with the
 *    instrument name and the command in flight.
 *  * Every fault is reported to the ErrorMonitor before it is thrown.
 *  * Owned exclusively by one controller; no locking.
 */
    class InstrumentSession {
    public:
      InstrumentSession(std::string name, std::unique_ptr<io::InstrumentTransport> transport,
                        core::ReadbackPolicy policy, std::shared_ptr<core::ErrorMonitor> errorMonitor,
                        core::Logger& log);
      ~InstrumentSession(); ///< closes the transport

      //---public APIs------------------------------------------------------
      void connect();             ///<- opens the transport, throws InstrumentFault
      void disconnect() noexcept; ///<- closes the transport
      bool isConnected() const;

      void sendCommand(const protocols::Command& cmd);
      protocols::Response query(const protocols::Command& cmd);

      /// Numeric query; NaN (plus a warning) if the reply is not a number.
      double queryNumber(const protocols::Command& cmd);

      /**
       * @brief Send "<header> <value>", read "<header>?" back, repeat until it
       *        matches within \p tolerance or the attempt budget is spent.
       * @returns the confirmed readback.
       */
      double setConfirmed(const std::string& header, double value, double tolerance);

      /// Query until the reply is one of \p accepted ("1", "ON", ...).
      void confirmState(const protocols::Command& query, std::initializer_list<const char*> accepted);

      /**
       * @brief Link for a shutdown path. Reconnects once if the link dropped after
       *        a successful connect(). @returns false if there is nothing to talk to.
       */
      bool linkForShutdown() noexcept;

      /// Best-effort command for shutdown paths: logs and returns false instead of throwing.
      bool trySend(const protocols::Command& cmd) noexcept;

      /// Report + throw. Marks nothing; the controller decides the mode.
      [[noreturn]] void raiseFault(const std::string& what);

      //---state------------------------------------------------------------
      SessionMode mode() const { return mode_; }
      void setMode(SessionMode m);
      std::optional<double> lastSetpoint() const { return lastSetpoint_; }
      void setLastSetpoint(double v) { lastSetpoint_ = v; }

      const std::string& name() const { return name_; }
      const core::ReadbackPolicy& policy() const { return policy_; }
      core::Logger& log() { return log_; }
      io::InstrumentTransport& transport() { return *transport_; }

      InstrumentSession(const InstrumentSession&) = delete;
      InstrumentSession& operator=(const InstrumentSession&) = delete;

    private:
      void pauseBeforeRetry(int attempt) const;

      std::string name_;
      std::unique_ptr<io::InstrumentTransport> transport_;
      core::ReadbackPolicy policy_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      core::Logger& log_;
      SessionMode mode_{ SessionMode::Uninitialized };
      std::optional<double> lastSetpoint_{};
      bool everConnected_{ false };
    };

  } // namespace devices
} // namespace ivbench
