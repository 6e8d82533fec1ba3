#pragma once
/** @file  FakeKeyInput.hpp
 *  @brief KeyInput derivative fed from the test thread instead of a terminal.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <condition_variable>
#include <deque>
#include <mutex>

#include "io/KeyInput.hpp"

namespace ivbench {
  namespace test {

    class FakeKeyInput : public io::KeyInput {
    public:
      bool open(int) override {
        std::lock_guard lock(mtx_);
        open_ = true;
        return true;
      }

      std::optional<char> readKey(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !keys_.empty(); });
        ++reads_;
        if (keys_.empty())
          return std::nullopt;
        char c = keys_.front();
        keys_.pop_front();
        return c;
      }

      bool isOpen() const override {
        std::lock_guard lock(mtx_);
        return open_;
      }

      void press(char c) {
        {
          std::lock_guard lock(mtx_);
          keys_.push_back(c);
        }
        cv_.notify_all();
      }

      /// EOF on the input
      void hangUp() {
        std::lock_guard lock(mtx_);
        open_ = false;
      }

      int reads() const {
        std::lock_guard lock(mtx_);
        return reads_;
      }

    private:
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<char> keys_;
      bool open_{ false };
      int reads_{ 0 };
    };

  } // namespace test
} // namespace ivbench
