#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "audio/device_interface.h"
#include <functional>
#include <memory>

namespace duplex_voice {

/**
 * @brief Microphone -> (AudioFrame, level) producer
 *
 * Owns the capture device exclusively. A dedicated thread blocks on the
 * device for one buffer at a time, so frames come out at the device's own
 * cadence. Each frame is delivered together with its RMS level.
 *
 * Thread Safety:
 * - open(), start() and stop() are called from the controlling thread
 * - The sink and error handler run on the capture thread and must not block
 * - stop() may also be called from inside the error handler
 */
class AudioCaptureStage {
public:
    using FrameSink = std::function<void(AudioFrame frame, float level)>;
    using ErrorHandler = std::function<void(const Error& error)>;

    AudioCaptureStage(std::unique_ptr<audio::ICaptureDevice> device, const AudioConfig& config);
    ~AudioCaptureStage();

    AudioCaptureStage(const AudioCaptureStage&) = delete;
    AudioCaptureStage& operator=(const AudioCaptureStage&) = delete;

    /**
     * @brief Acquire the microphone without starting capture
     * @return PermissionDenied or DeviceUnavailable on failure; the device is released again
     */
    Result<void> open();

    /**
     * @brief Start the capture thread on the device acquired by open()
     * @param sink Receives every frame in capture order with its level
     * @param on_error Called once if the device stops delivering audio
     * @return InvalidState if the device is not open (never opened, or
     *         already released by stop())
     */
    Result<void> start(FrameSink sink, ErrorHandler on_error);

    /**
     * @brief Stop capturing and release the device. No-op when idle; safe to repeat.
     */
    void stop();

    bool is_running() const;
    bool device_open() const;
    uint64_t frames_captured() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace duplex_voice
