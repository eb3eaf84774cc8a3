#include "session_backend.h"
#include "audio/portaudio_devices.h"
#include "net/curl_websocket_channel.h"

namespace duplex_voice {

std::unique_ptr<audio::ICaptureDevice> DefaultSessionBackend::create_capture_device(const AudioConfig& config) {
    return std::make_unique<audio::PortAudioCaptureDevice>(config.input_device);
}

std::unique_ptr<audio::IOutputDevice> DefaultSessionBackend::create_output_device(const AudioConfig& config) {
    return std::make_unique<audio::PortAudioOutputDevice>(config.output_device);
}

std::unique_ptr<net::IChannel> DefaultSessionBackend::create_channel(const TransportConfig&) {
    return std::make_unique<net::CurlWebSocketChannel>();
}

} // namespace duplex_voice
