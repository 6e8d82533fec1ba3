#pragma once
/** @file  Command.hpp
 *  @brief One SCPI-style instruction and its wire framing.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <string>

namespace ivbench {
  namespace protocols {
    struct Command {
      std::string payload;

      /// SCPI queries end in '?' (e.g. "MEASure:VOLTage?").
      bool isQuery() const { return !payload.empty() && payload.back() == '?'; }

      std::string toWire() const { return payload + "\n"; }

      /// "<header> <value>" with enough digits for instrument resolution.
      static Command withValue(const std::string& header, double value) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.6g", value);
        return Command{ header + " " + buf };
      }

      /// "<header>?" query form of a set command.
      static Command queryOf(const std::string& header) { return Command{ header + "?" }; }
    };

  } // namespace protocols
} // namespace ivbench
