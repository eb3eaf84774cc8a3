#pragma once

#include "net/channel_interface.h"
#include <memory>

namespace duplex_voice {
namespace net {

/**
 * @brief IChannel over libcurl's WebSocket API (connect-only mode)
 *
 * Text and binary frames are both delivered as messages; fragmented messages
 * are reassembled. Pings are answered by libcurl. One mutex serializes access
 * to the easy handle, so one thread may send while another receives.
 * The connect itself runs outside that mutex; close() from another thread
 * aborts it and open() then fails with NetworkError.
 */
class CurlWebSocketChannel : public IChannel {
public:
    CurlWebSocketChannel();
    ~CurlWebSocketChannel() override;

    CurlWebSocketChannel(const CurlWebSocketChannel&) = delete;
    CurlWebSocketChannel& operator=(const CurlWebSocketChannel&) = delete;

    Result<void> open(const std::string& url,
                      const std::vector<std::string>& headers,
                      int timeout_ms) override;
    Result<void> send_text(const std::string& message) override;
    Result<ReceiveStatus> receive(std::string& out, int timeout_ms) override;
    int close_code() const override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace net
} // namespace duplex_voice
