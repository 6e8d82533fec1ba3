/* @file FileLogger.cpp
 * @brief buffered stdio writer
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

using namespace ivbench::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path, bool append) {
  close();
  fp_ = std::fopen(path.c_str(), append ? "a" : "w");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " opening " << path << ": " << strerror(errno) << "\n";
    return false;
  }
  path_ = path;
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  bool ok = true;
  std::size_t off = 0;
  while (off < buffer_.size()) {
    std::size_t n = std::min(kChunk, buffer_.size() - off);
    if (std::fwrite(buffer_.data() + off, 1, n, fp_) != n) {
      std::cerr << "Error " << errno << " writing " << path_ << ": " << strerror(errno) << "\n";
      ok = false;
      break;
    }
    off += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0 && ok;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
