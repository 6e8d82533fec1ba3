#pragma once
/** @file  AbortMonitor.hpp
 *  @brief Operator abort watcher (runs its own thread), sticky cancellation flag.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/KeyInput.hpp"

namespace ivbench::core {

  /**
 * @class AbortMonitor
 * @brief Watches the abort key on a background thread; the engine only polls.
 *
 *  * `abortRequested()` never blocks and is safe from any thread.
 *  * Once set the flag stays set for the life of the monitor (no un-abort).
 *  * `waitFor()` is an abort-aware sleep for settle delays.
 */
  class AbortMonitor {
  public:
    explicit AbortMonitor(char abortKey = 'q') : abortKey_(abortKey) {}
    ~AbortMonitor(); ///< stop()

    //---public API-----------------------------------------------------
    /// Launch the key watcher thread. \p input must already be open.
    void start(std::unique_ptr<io::KeyInput> input);
    void stop(); ///< join the watcher thread, restore the terminal

    /// Sets the sticky flag; only the first reason is kept.
    void requestAbort(const std::string& reason);
    bool abortRequested() const noexcept { return aborted_.load(std::memory_order_acquire); }
    std::string reason() const;

    /// Sleep up to \p duration. @returns true if an abort is (or becomes) pending.
    bool waitFor(std::chrono::milliseconds duration) const;

    /// Called once, from whichever thread raised the abort.
    void registerCallback(std::function<void(const std::string&)> cb);

    AbortMonitor(const AbortMonitor&) = delete;
    AbortMonitor& operator=(const AbortMonitor&) = delete;

  private:
    void pollKeys(); ///< worker body

    char abortKey_;
    std::atomic<bool> aborted_{ false };
    std::atomic<bool> running_{ false };
    std::unique_ptr<io::KeyInput> input_;
    std::thread worker_;

    mutable std::mutex mtx_; ///< guards reason_, cb_; pairs with cv_
    mutable std::condition_variable cv_;
    std::string reason_;
    std::function<void(const std::string&)> cb_{};

    static constexpr std::chrono::milliseconds kPollInterval{ 50 };
  };

} // namespace ivbench::core
