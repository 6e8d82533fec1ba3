#pragma once
/** @file  CsvResultSink.hpp
 *  @brief ResultSink that writes one CSV row per StepRecord.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <string>

#include "core/ResultSink.hpp"
#include "io/FileLogger.hpp"

namespace ivbench::io {

  /**
 * @class CsvResultSink
 * @brief Header plus one flushed row per record, `# outcome` trailer on finalize.
 *
 *  * Rows are flushed as they arrive so an interrupted run keeps what it measured.
 */
  class CsvResultSink : public core::ResultSink {
  public:
    /// Throws std::runtime_error if \p path cannot be created.
    explicit CsvResultSink(const std::string& path);

    void append(const core::StepRecord& record) override;
    void finalize(const core::RunOutcome& outcome) override;

    /// Row text without trailing newline (exposed for tests).
    static std::string formatRow(const core::StepRecord& record);
    static const char* header();

  private:
    FileLogger file_;
  };

} // namespace ivbench::io
