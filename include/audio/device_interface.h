#pragma once

/**
 * @file device_interface.h
 * @brief Audio device interfaces
 *
 * The capture stage and the playback scheduler talk to hardware only through
 * these, so PortAudio can be swapped for another backend or a test double.
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace duplex_voice {
namespace audio {

/**
 * @brief Exclusive microphone handle
 */
class ICaptureDevice {
public:
    virtual ~ICaptureDevice() = default;

    /**
     * @brief Acquire the device
     * @param sample_rate Capture rate in Hz
     * @param frame_samples Samples per read() call; sets the device buffer size
     * @return PermissionDenied if access was refused, DeviceUnavailable if no usable input exists
     */
    virtual Result<void> open(int sample_rate, int frame_samples) = 0;

    /**
     * @brief Block until exactly `frame_samples` mono samples are available
     * @param out Filled with normalized samples in [-1, 1]
     * @return False when the device failed or was closed
     */
    virtual bool read(FloatSamples& out) = 0;

    /// Release the device. Safe to call when not open, and more than once.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief Output device with a sample-accurate clock and start-time scheduling
 *
 * now() is the device's playable time in seconds since open(); it advances only
 * as samples are rendered. A buffer scheduled at time t starts exactly at t,
 * or immediately if t has already passed.
 */
class IOutputDevice {
public:
    virtual ~IOutputDevice() = default;

    virtual Result<void> open(int sample_rate) = 0;

    virtual double now() const = 0;

    /**
     * @brief Hand a buffer over for playback at `start_time` (device seconds)
     */
    virtual void schedule(DecodedAudioBuffer buffer, double start_time) = 0;

    /// Drop every scheduled buffer that has not started playing
    virtual void cancel_pending() = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace audio
} // namespace duplex_voice
