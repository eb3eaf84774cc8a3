#pragma once

/**
 * @file session_backend.h
 * @brief Factory for the hardware and network handles a session acquires
 *
 * SessionController asks the backend for fresh handles on every connect(), so
 * each session instance owns its own devices and channel.
 */

#include "config.h"
#include "audio/device_interface.h"
#include "net/channel_interface.h"
#include <memory>

namespace duplex_voice {

class ISessionBackend {
public:
    virtual ~ISessionBackend() = default;

    virtual std::unique_ptr<audio::ICaptureDevice> create_capture_device(const AudioConfig& config) = 0;
    virtual std::unique_ptr<audio::IOutputDevice> create_output_device(const AudioConfig& config) = 0;
    virtual std::unique_ptr<net::IChannel> create_channel(const TransportConfig& config) = 0;
};

/**
 * @brief PortAudio microphone and speaker, libcurl WebSocket channel
 */
class DefaultSessionBackend : public ISessionBackend {
public:
    std::unique_ptr<audio::ICaptureDevice> create_capture_device(const AudioConfig& config) override;
    std::unique_ptr<audio::IOutputDevice> create_output_device(const AudioConfig& config) override;
    std::unique_ptr<net::IChannel> create_channel(const TransportConfig& config) override;
};

} // namespace duplex_voice
