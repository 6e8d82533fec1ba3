#pragma once
/** @file  SocketTransport.hpp
 *  @brief InstrumentTransport over a raw SCPI TCP socket.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <cstdint>
#include <memory>

#include "io/InstrumentTransport.hpp"
#include "io/SocketChannel.hpp"

namespace ivbench::io {

  /**
 * @class SocketTransport
 * @brief One line out, one line back over a raw SCPI socket.
 *
 *  * A timed-out query drops the connection and reconnects. If that fails the
 *    transport stays closed and the next send() throws.
 */
  class SocketTransport : public InstrumentTransport {
  public:
    SocketTransport(std::string host, std::uint16_t port, std::chrono::milliseconds timeout,
                    std::unique_ptr<SocketChannel> channel = std::make_unique<SocketChannel>());

    void open() override;
    void close() override;
    bool isOpen() const override { return channel_->isOpen(); }

    void send(const protocols::Command& cmd) override;
    protocols::Response query(const protocols::Command& cmd,
                              std::chrono::milliseconds timeout) override;
    using InstrumentTransport::query;

    std::string describe() const override;
    std::chrono::milliseconds defaultTimeout() const override { return timeout_; }

  private:
    void resync(); ///< reconnect after a timeout so a late reply cannot be read

    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<SocketChannel> channel_;
  };

} // namespace ivbench::io
