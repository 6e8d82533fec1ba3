/* @file Logger.cpp
 * @brief worker-thread logger: console lines + CSV event file
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>

// ivbench headers
#include "core/Logger.hpp"

using namespace ivbench::core;

namespace {

  std::string stamp(std::chrono::system_clock::time_point tp, bool withDate) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);
    char buf[40];
    if (withDate)
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d", local.tm_year + 1900,
                    local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec,
                    static_cast<int>(ms));
    else
      std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                    local.tm_sec, static_cast<int>(ms));
    return buf;
  }

  std::string csvField(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
      if (c == '"')
        out += '"';
      out += (c == '\n' ? ' ' : c);
    }
    return out + "\"";
  }

} // namespace

const char* ivbench::core::toString(Severity s) {
  switch (s) {
  case Severity::Debug:
    return "DEBUG";
  case Severity::Info:
    return "INFO";
  case Severity::Warning:
    return "WARN";
  case Severity::Error:
    return "ERROR";
  default:
    return "?";
  }
}

Logger::Logger(std::ostream& console, Severity consoleLevel, std::size_t queueCapacity)
    : console_(console), consoleLevel_(consoleLevel), buffer_(queueCapacity) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& eventLogPath) {
  finishRun();

  bool ok = true;
  {
    std::lock_guard wlock(writeMtx_);
    if (!eventLogPath.empty()) {
      ok = csvFile_.open(eventLogPath);
      if (ok)
        csvFile_.write("time,severity,source,message\n");
    }
  }

  {
    std::lock_guard lock(mtx_);
    dropped_ = 0;
    running_ = true;
  }
  worker_ = std::thread(&Logger::workerLoop, this);
  return ok;
}

void Logger::log(LogEvent event) {
  {
    std::lock_guard lock(mtx_);
    if (running_) {
      if (!buffer_.push(std::move(event)))
        ++dropped_;
      cv_.notify_one();
      return;
    }
  }
  write(event);
}

void Logger::finishRun() {
  {
    std::lock_guard lock(mtx_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();

  std::size_t lost = dropped();
  if (lost > 0)
    write(LogEvent{ Severity::Warning, "Logger",
                    std::to_string(lost) + " events dropped (queue full)",
                    std::chrono::system_clock::now() });

  std::lock_guard wlock(writeMtx_);
  csvFile_.close();
  console_.flush();
}

std::size_t Logger::dropped() const {
  std::lock_guard lock(mtx_);
  return dropped_;
}

void Logger::workerLoop() {
  while (true) {
    std::optional<LogEvent> next;
    {
      std::unique_lock lock(mtx_);
      cv_.wait(lock, [this] { return !buffer_.empty() || !running_; });
      next = buffer_.pop();
      if (!next && !running_)
        return; // drained and stopped
    }
    if (next)
      write(*next);
  }
}

void Logger::write(const LogEvent& event) {
  std::lock_guard wlock(writeMtx_);
  if (event.severity >= consoleLevel_.load()) {
    console_ << "[" << stamp(event.time, false) << "] [" << toString(event.severity) << "] ["
             << event.source << "] " << event.message << "\n";
  }
  if (csvFile_.isOpen()) {
    csvFile_.write(stamp(event.time, true) + "," + toString(event.severity) + "," +
                   csvField(event.source) + "," + csvField(event.message) + "\n");
    if (event.severity >= Severity::Warning)
      csvFile_.flush();
  }
}
