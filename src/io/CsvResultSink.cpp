/* @file CsvResultSink.cpp
 * @brief CSV persistence of sweep results
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdio>
#include <ctime>
#include <stdexcept>

// ivbench headers
#include "io/CsvResultSink.hpp"

using namespace ivbench::io;
using ivbench::core::RunOutcome;
using ivbench::core::StepRecord;

namespace {

  std::string number(double v) {
    if (std::isnan(v))
      return "nan";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
  }

  std::string isoTime(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                  utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(ms));
    return buf;
  }

  /// notes may contain commas or quotes (instrument error strings)
  std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
      if (c == '"')
        out += '"';
      out += c;
    }
    return out + "\"";
  }

} // namespace

CsvResultSink::CsvResultSink(const std::string& path) {
  if (!file_.open(path))
    throw std::runtime_error("[CsvResultSink] cannot create " + path);
  // goes out with the first row (or the trailer), both flushes are checked
  file_.write(std::string(header()) + "\n");
}

const char* CsvResultSink::header() {
  return "timestamp,v_index,i_index,v_set,i_set,v_source,v_load,i_load,p_load,status,note";
}

std::string CsvResultSink::formatRow(const StepRecord& r) {
  return isoTime(r.timestamp) + "," + std::to_string(r.voltageIndex) + "," +
         std::to_string(r.currentIndex) + "," + number(r.commandedVoltage) + "," +
         number(r.commandedCurrent) + "," + number(r.sourceVoltage) + "," + number(r.loadVoltage) +
         "," + number(r.loadCurrent) + "," + number(r.loadPower) + "," + toString(r.status) + "," +
         quoted(r.note);
}

void CsvResultSink::append(const StepRecord& record) {
  file_.write(formatRow(record) + "\n");
  if (!file_.flush())
    throw std::runtime_error("[CsvResultSink] write to " + file_.path() + " failed");
}

void CsvResultSink::finalize(const RunOutcome& outcome) {
  file_.write(std::string("# outcome=") + toString(outcome.status) +
              " v_index=" + std::to_string(outcome.voltageIndex) +
              " i_index=" + std::to_string(outcome.currentIndex) +
              (outcome.reason.empty() ? "" : " reason=" + quoted(outcome.reason)) + "\n");
  bool ok = file_.flush();
  file_.close();
  if (!ok)
    throw std::runtime_error("[CsvResultSink] write to " + file_.path() + " failed");
}
