#pragma once

/**
 * @file channel_interface.h
 * @brief Message-oriented duplex channel
 *
 * TransportSession speaks to the network only through IChannel, so the
 * WebSocket backend can be replaced by an in-process fake in tests.
 */

#include "errors.h"
#include <string>
#include <vector>

namespace duplex_voice {
namespace net {

/// Close code the remote sends when it rejects our credentials (policy violation)
constexpr int CLOSE_POLICY_VIOLATION = 1008;
constexpr int CLOSE_NORMAL = 1000;

enum class ReceiveStatus {
    Message,   ///< One complete message was stored in the output string
    Timeout,   ///< Nothing arrived within the timeout
    Closed     ///< The remote closed the channel (see close_code())
};

class IChannel {
public:
    virtual ~IChannel() = default;

    /**
     * @brief Connect and complete the upgrade
     * @param url ws:// or wss:// URL, credentials already applied
     * @param headers Extra request headers ("Name: value")
     * @param timeout_ms Connect timeout
     * @return AuthError if the remote refused the credentials (HTTP 401/403),
     *         NetworkError for every other connect failure
     */
    virtual Result<void> open(const std::string& url,
                              const std::vector<std::string>& headers,
                              int timeout_ms) = 0;

    /**
     * @brief Send one text message. Callable from a different thread than receive().
     * @return NetworkError if the channel is closed or the write failed
     */
    virtual Result<void> send_text(const std::string& message) = 0;

    /**
     * @brief Wait up to `timeout_ms` for the next complete message
     * @return Status, or NetworkError if the channel dropped
     */
    virtual Result<ReceiveStatus> receive(std::string& out, int timeout_ms) = 0;

    /// Close code of the remote's close frame, 0 if none was received
    virtual int close_code() const = 0;

    /// Release the connection. Idempotent, callable from any thread.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace net
} // namespace duplex_voice
