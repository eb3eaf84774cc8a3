#pragma once

/**
 * @file portaudio_devices.h
 * @brief PortAudio implementations of the capture and output devices
 */

#include "audio/device_interface.h"
#include <memory>
#include <string>

namespace duplex_voice {
namespace audio {

/**
 * @brief Microphone via a blocking PortAudio input stream
 *
 * The stream's buffer size equals the frame size, so read() returns once per
 * device buffer and capture keeps pace with the hardware rather than a timer.
 */
class PortAudioCaptureDevice : public ICaptureDevice {
public:
    /**
     * @param device_name "default", a device index, or an exact device name
     */
    explicit PortAudioCaptureDevice(const std::string& device_name);
    ~PortAudioCaptureDevice() override;

    PortAudioCaptureDevice(const PortAudioCaptureDevice&) = delete;
    PortAudioCaptureDevice& operator=(const PortAudioCaptureDevice&) = delete;

    Result<void> open(int sample_rate, int frame_samples) override;
    bool read(FloatSamples& out) override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Speaker via a PortAudio callback stream with a timeline of scheduled buffers
 *
 * The device clock counts rendered frames, so now() is exact to the sample.
 * Buffers whose range intersects a callback window are copied in; gaps render silence.
 */
class PortAudioOutputDevice : public IOutputDevice {
public:
    explicit PortAudioOutputDevice(const std::string& device_name);
    ~PortAudioOutputDevice() override;

    PortAudioOutputDevice(const PortAudioOutputDevice&) = delete;
    PortAudioOutputDevice& operator=(const PortAudioOutputDevice&) = delete;

    Result<void> open(int sample_rate) override;
    double now() const override;
    void schedule(DecodedAudioBuffer buffer, double start_time) override;
    void cancel_pending() override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief List all available audio devices through the logger
 */
void list_devices();

} // namespace audio
} // namespace duplex_voice
