#pragma once
/** @file  GpibTransport.hpp
 *  @brief InstrumentTransport for a GPIB instrument behind a USB-GPIB controller.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <memory>

#include "io/InstrumentTransport.hpp"
#include "io/SerialChannel.hpp"

namespace ivbench::io {

  /// Parsed "GPIB<board>::<primary>[::<secondary>]::INSTR" resource string.
  struct GpibAddress {
    int board{ 0 };
    int primary{ 0 };
    int secondary{ -1 }; ///< -1 == none

    /// Throws core::ConfigurationError on a malformed resource or out-of-range address.
    static GpibAddress parse(const std::string& resource);
  };

  /**
 * @class GpibTransport
 * @brief Drives a Prologix / AR488 compatible controller in controller mode.
 *
 *  * `open()` puts the adapter in controller mode with auto-read off and
 *    addresses the instrument; each query is followed by `++read eoi`.
 *  * The adapter itself lives on a SerialChannel (/dev/ttyUSB*).
 *  * A timed-out query is followed by a device clear (`++clr`) so the late
 *    reply cannot answer the next query.
 */
  class GpibTransport : public InstrumentTransport {
  public:
    GpibTransport(std::string resource, std::string controllerDevice,
                  std::chrono::milliseconds timeout,
                  std::unique_ptr<SerialChannel> channel = std::make_unique<SerialChannel>("\n"));

    void open() override;
    void close() override;
    bool isOpen() const override { return channel_->isOpen(); }

    void send(const protocols::Command& cmd) override;
    protocols::Response query(const protocols::Command& cmd,
                              std::chrono::milliseconds timeout) override;
    using InstrumentTransport::query;

    std::string describe() const override { return resource_; }
    std::chrono::milliseconds defaultTimeout() const override { return timeout_; }

    const GpibAddress& address() const { return address_; }

  private:
    void writeRaw(const std::string& line);
    void resync(); ///< device clear after a timeout

    std::string resource_;
    std::string controllerDevice_;
    GpibAddress address_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<SerialChannel> channel_;

    static constexpr speed_t kControllerBaud = B115200;
  };

} // namespace ivbench::io
