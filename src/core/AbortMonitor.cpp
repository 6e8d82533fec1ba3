/* @file AbortMonitor.cpp
 * @brief key watcher thread + sticky abort flag
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cctype>

// ivbench headers
#include "core/AbortMonitor.hpp"

using namespace ivbench::core;

AbortMonitor::~AbortMonitor() { stop(); }

void AbortMonitor::start(std::unique_ptr<io::KeyInput> input) {
  stop();
  input_ = std::move(input);
  if (!input_)
    return;
  running_ = true;
  worker_ = std::thread(&AbortMonitor::pollKeys, this);
}

void AbortMonitor::stop() {
  running_ = false;
  if (worker_.joinable())
    worker_.join();
  if (input_)
    input_->close();
  input_.reset();
}

void AbortMonitor::requestAbort(const std::string& reason) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard lock(mtx_);
    if (aborted_.load(std::memory_order_relaxed))
      return; // sticky, first reason wins
    reason_ = reason;
    aborted_.store(true, std::memory_order_release);
    cb = cb_;
  }
  cv_.notify_all();
  if (cb)
    cb(reason);
}

std::string AbortMonitor::reason() const {
  std::lock_guard lock(mtx_);
  return reason_;
}

bool AbortMonitor::waitFor(std::chrono::milliseconds duration) const {
  std::unique_lock lock(mtx_);
  return cv_.wait_for(lock, duration, [this] { return aborted_.load(std::memory_order_acquire); });
}

void AbortMonitor::registerCallback(std::function<void(const std::string&)> cb) {
  std::lock_guard lock(mtx_);
  cb_ = std::move(cb);
}

void AbortMonitor::pollKeys() {
  const auto wanted = std::tolower(static_cast<unsigned char>(abortKey_));
  while (running_ && !abortRequested()) {
    if (!input_->isOpen())
      return; // EOF, nothing left to watch

    auto key = input_->readKey(kPollInterval);
    if (!key)
      continue;
    if (*key == io::KeyInput::kInterrupt) {
      requestAbort("operator interrupt (Ctrl-C)");
    } else if (std::tolower(static_cast<unsigned char>(*key)) == wanted) {
      requestAbort(std::string("operator pressed '") + abortKey_ + "'");
    }
  }
}
