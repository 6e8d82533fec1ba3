/* @file Response.cpp
 * @brief reply cleanup and numeric parsing
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cerrno>
#include <cstdlib>

// ivbench headers
#include "protocols/Response.hpp"

using namespace ivbench::protocols;

std::string ivbench::protocols::trim(const std::string& s) {
  const char* ws = " \t\r\n\v\f";
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != '\0') // the grid simulator pads its replies with NULs
      out.push_back(c);
  }
  auto first = out.find_first_not_of(ws);
  if (first == std::string::npos)
    return {};
  auto last = out.find_last_not_of(ws);
  return out.substr(first, last - first + 1);
}

std::optional<Response> Response::fromWire(const std::string& raw) {
  auto cleaned = trim(raw);
  if (cleaned.empty())
    return std::nullopt;
  return Response{ std::move(cleaned) };
}

std::optional<double> Response::asNumber() const {
  if (text.empty())
    return std::nullopt;

  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || errno == ERANGE)
    return std::nullopt;

  // allow a trailing unit suffix separated by whitespace ("120.1 V"), nothing else
  while (*end == ' ' || *end == '\t')
    ++end;
  if (*end != '\0' && !std::isalpha(static_cast<unsigned char>(*end)))
    return std::nullopt;
  return v;
}

std::vector<std::string> Response::fields() const {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (true) {
    auto pos = text.find(',', start);
    out.push_back(trim(text.substr(start, pos == std::string::npos ? pos : pos - start)));
    if (pos == std::string::npos)
      break;
    start = pos + 1;
  }
  return out;
}
