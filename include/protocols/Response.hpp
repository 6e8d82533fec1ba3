#pragma once
/** @file  Response.hpp
 *  @brief Reply text from an instrument, cleaned of framing and NUL padding.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

namespace ivbench {
  namespace protocols {
    struct Response {
      std::string text;

      /// Strips whitespace, CR/LF and '\0' padding. Empty replies yield std::nullopt.
      static std::optional<Response> fromWire(const std::string& raw);

      /// Parses the whole reply as a number; std::nullopt if it is not one.
      std::optional<double> asNumber() const;

      /// Comma separated fields, each trimmed (e.g. "SOURce:SAFety?").
      std::vector<std::string> fields() const;
    };

    /// Trim helper shared with the transports.
    std::string trim(const std::string& s);

  } // namespace protocols
} // namespace ivbench
