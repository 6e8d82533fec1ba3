/* @file SweepPlan.cpp
 * @brief range expansion, plan validation and the JSON schema
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <sstream>

// Third-party headers
#include <nlohmann/json.hpp>

// ivbench headers
#include "core/Errors.hpp"
#include "core/SweepPlan.hpp"

using namespace ivbench::core;
using nlohmann::json;

namespace {

  constexpr std::size_t kMaxRangeValues = 100000;

  std::string describe(const SweepRange& r) {
    std::ostringstream os;
    os << r.start << r.unit << " -> " << r.stop << r.unit << " step " << r.step << r.unit;
    return os.str();
  }

  template <typename T> T required(const json& obj, const char* blk, const char* key) {
    if (!obj.contains(key))
      throw ConfigurationError(std::string("[SweepPlan] missing '") + blk + "." + key + "'");
    try {
      return obj.at(key).get<T>();
    } catch (const json::exception& e) {
      throw ConfigurationError(std::string("[SweepPlan] bad '") + blk + "." + key +
                               "': " + e.what());
    }
  }

  template <typename T> T optionalField(const json& obj, const char* blk, const char* key, T fallback) {
    if (!obj.contains(key))
      return fallback;
    return required<T>(obj, blk, key);
  }

  const json& block(const json& root, const char* name) {
    if (!root.contains(name))
      throw ConfigurationError(std::string("[SweepPlan] missing block '") + name + "'");
    const json& b = root.at(name);
    if (!b.is_object())
      throw ConfigurationError(std::string("[SweepPlan] '") + name + "' must be an object");
    return b;
  }

  const json& optionalBlock(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name))
      return empty;
    return block(root, name);
  }

  std::chrono::milliseconds millis(const json& obj, const char* blk, const char* key,
                                   std::chrono::milliseconds fallback) {
    auto v = optionalField<long long>(obj, blk, key, fallback.count());
    if (v < 0)
      throw ConfigurationError(std::string("[SweepPlan] '") + blk + "." + key + "' is negative");
    return std::chrono::milliseconds{ v };
  }

  SweepRange parseRange(const json& root, const char* name, const char* defaultUnit) {
    const json& b = block(root, name);
    SweepRange r;
    r.start = required<double>(b, name, "start");
    r.stop = required<double>(b, name, "stop");
    r.step = required<double>(b, name, "step");
    r.unit = optionalField<std::string>(b, name, "unit", defaultUnit);
    return r;
  }

  void checkWithin(const SweepRange& r, double lo, double hi, const char* what) {
    for (double v : r.values()) {
      if (v < lo || v > hi) {
        std::ostringstream os;
        os << "[SweepPlan] " << what << " value " << v << r.unit << " outside [" << lo << ", " << hi
           << "]";
        throw ConfigurationError(os.str());
      }
    }
  }

} // namespace

std::vector<double> SweepRange::values() const {
  if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step))
    throw ConfigurationError("[SweepRange] non-finite bound in " + describe(*this));
  if (step == 0.0)
    throw ConfigurationError("[SweepRange] step must be non-zero in " + describe(*this));
  if ((stop - start) * step < 0.0)
    throw ConfigurationError("[SweepRange] step points away from stop in " + describe(*this));

  // epsilon so 0 -> 10 step 2.5 includes 10 despite float error
  const double span = (stop - start) / step;
  const double steps = std::floor(span + 1e-6);
  if (steps + 1.0 > static_cast<double>(kMaxRangeValues))
    throw ConfigurationError("[SweepRange] too many values in " + describe(*this));

  const auto n = static_cast<std::size_t>(steps) + 1;
  std::vector<double> out;
  out.reserve(n);
  for (std::size_t k = 0; k < n; ++k) {
    double v = start + static_cast<double>(k) * step;
    // 0 -> 0.3 step 0.1 lands on 0.30000000000000004; report stop itself
    if (std::fabs(v - stop) <= std::fabs(step) * 1e-6)
      v = stop;
    out.push_back(v);
  }
  return out;
}

void SweepPlan::validate() const {
  // ranges first: values() throws on shape errors
  voltage.values();
  current.values();

  if (!(limits.maxVoltage > 0.0) || !(limits.maxCurrent > 0.0) || !(limits.maxPower > 0.0))
    throw ConfigurationError("[SweepPlan] safety limits must be positive");
  if (!(limits.frequency > 0.0))
    throw ConfigurationError("[SweepPlan] frequency must be positive");
  if (!(limits.crestFactor > 0.0) || limits.crestFactor > 5.0)
    throw ConfigurationError("[SweepPlan] crest factor must be in (0, 5]");
  if (!(limits.powerFactor > 0.0) || limits.powerFactor > 1.0)
    throw ConfigurationError("[SweepPlan] power factor must be in (0, 1]");
  if (!(limits.peakFactor > 0.0) || !(limits.minPeakCurrent > 0.0))
    throw ConfigurationError("[SweepPlan] peak-current trigger settings must be positive");

  checkWithin(voltage, 0.0, limits.maxVoltage, "voltage");
  checkWithin(current, 0.0, limits.maxCurrent, "current");

  if (readback.attempts < 1)
    throw ConfigurationError("[SweepPlan] readback attempts must be at least 1");
  if (!(readback.voltageTolerance > 0.0) || !(readback.currentTolerance > 0.0))
    throw ConfigurationError("[SweepPlan] readback tolerances must be positive");

  if (source.host.empty())
    throw ConfigurationError("[SweepPlan] source host is empty");
  if (source.port == 0)
    throw ConfigurationError("[SweepPlan] source port is zero");
  if (load.resource.empty())
    throw ConfigurationError("[SweepPlan] load resource is empty");
  if (load.controller.empty())
    throw ConfigurationError("[SweepPlan] load controller device is empty");
  if (abortKey == '\0')
    throw ConfigurationError("[SweepPlan] abort key is empty");
}

SweepPlan SweepPlan::fromJson(const json& j) {
  if (!j.is_object())
    throw ConfigurationError("[SweepPlan] top level must be an object");

  SweepPlan plan;

  const json& src = block(j, "source");
  plan.source.host = required<std::string>(src, "source", "host");
  auto port = optionalField<int>(src, "source", "port", plan.source.port);
  if (port <= 0 || port > 65535)
    throw ConfigurationError("[SweepPlan] 'source.port' out of range");
  plan.source.port = static_cast<std::uint16_t>(port);
  plan.source.channel = optionalField<int>(src, "source", "channel", plan.source.channel);
  plan.source.timeout = millis(src, "source", "timeout_ms", plan.source.timeout);

  const json& ld = block(j, "load");
  plan.load.resource = required<std::string>(ld, "load", "resource");
  plan.load.controller = required<std::string>(ld, "load", "controller");
  plan.load.timeout = millis(ld, "load", "timeout_ms", plan.load.timeout);

  plan.voltage = parseRange(j, "voltage", "V");
  plan.current = parseRange(j, "current", "A");

  const json& lim = optionalBlock(j, "limits");
  auto& L = plan.limits;
  L.maxVoltage = optionalField<double>(lim, "limits", "max_voltage", L.maxVoltage);
  L.maxCurrent = optionalField<double>(lim, "limits", "max_current", L.maxCurrent);
  L.maxPower = optionalField<double>(lim, "limits", "max_power", L.maxPower);
  L.frequency = optionalField<double>(lim, "limits", "frequency", L.frequency);
  L.crestFactor = optionalField<double>(lim, "limits", "crest_factor", L.crestFactor);
  L.powerFactor = optionalField<double>(lim, "limits", "power_factor", L.powerFactor);
  L.peakFactor = optionalField<double>(lim, "limits", "peak_factor", L.peakFactor);
  L.minPeakCurrent = optionalField<double>(lim, "limits", "min_peak_current", L.minPeakCurrent);

  const json& rb = optionalBlock(j, "readback");
  auto& R = plan.readback;
  R.attempts = optionalField<int>(rb, "readback", "attempts", R.attempts);
  R.voltageTolerance = optionalField<double>(rb, "readback", "voltage_tolerance", R.voltageTolerance);
  R.currentTolerance = optionalField<double>(rb, "readback", "current_tolerance", R.currentTolerance);
  R.retryDelay = millis(rb, "readback", "retry_delay_ms", R.retryDelay);

  const json& tm = optionalBlock(j, "timing");
  auto& T = plan.timing;
  T.settle = millis(tm, "timing", "settle_ms", T.settle);
  T.sourceSettle = millis(tm, "timing", "source_settle_ms", T.sourceSettle);
  T.outputOn = millis(tm, "timing", "output_on_ms", T.outputOn);
  T.rampDown = millis(tm, "timing", "ramp_down_ms", T.rampDown);
  T.loadReset = millis(tm, "timing", "load_reset_ms", T.loadReset);

  auto key = optionalField<std::string>(j, "root", "abort_key", "q");
  if (key.size() != 1)
    throw ConfigurationError("[SweepPlan] 'abort_key' must be a single character");
  plan.abortKey = key.front();

  plan.validate();
  return plan;
}
