#include "audio/portaudio_devices.h"
#include "audio/output_timeline.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>

namespace duplex_voice {
namespace audio {

namespace {

/**
 * Resolve "default", a numeric index, or an exact name to a device index.
 * Returns paNoDevice when nothing suitable exists. Pa_Initialize must have succeeded.
 */
PaDeviceIndex find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();
    if (num_devices <= 0) {
        return paNoDevice;
    }

    if (name == "default" || name.empty()) {
        PaDeviceIndex default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
        }
        return default_idx;
    }

    // Try parsing as numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || name != info->name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }
    return paNoDevice;
}

/**
 * Classify a stream open/start failure. On macOS a refused microphone surfaces
 * as an unanticipated host error; everything else means the device is unusable.
 */
Error classify_stream_error(PaError err, const std::string& what) {
    std::string message = what + ": " + Pa_GetErrorText(err) + " (error code " + std::to_string(err) + ")";
    if (err == paUnanticipatedHostError) {
        const PaHostErrorInfo* host = Pa_GetLastHostErrorInfo();
        if (host && host->errorText) {
            message += " host: " + std::string(host->errorText);
        }
        return make_permission_error(message);
    }
    return make_device_error(message);
}

} // anonymous namespace

// =============================================================================
// Capture
// =============================================================================

class PortAudioCaptureDevice::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), initialized_(false), frame_samples_(0) {}

    ~Impl() {
        close();
    }

    Result<void> open(int sample_rate, int frame_samples) {
        if (stream_) {
            return make_error(ErrorType::InvalidState, "capture device already open");
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        initialized_ = true;

        PaDeviceIndex input_idx = find_device(device_name_, true);
        if (input_idx == paNoDevice) {
            close();
            return make_device_error("Input device not found: " + device_name_);
        }
        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels <= 0) {
            close();
            return make_device_error("Device '" + device_name_ + "' has no input channels");
        }

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate,
                            static_cast<unsigned long>(frame_samples), paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            Error e = classify_stream_error(err, "Failed to open input stream");
            close();
            return e;
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Error e = classify_stream_error(err, "Failed to start input stream");
            if (e.type == ErrorType::PermissionDenied) {
                Logger::error("Microphone access was refused. Check the OS privacy settings "
                              "for microphone access and try again.");
            }
            close();
            return e;
        }

        frame_samples_ = frame_samples;
        std::ostringstream oss;
        oss << "Using input device: [" << input_idx << "] " << input_info->name
            << " @ " << sample_rate << " Hz, " << frame_samples << " samples/frame";
        Logger::info(oss.str());
        return {};
    }

    bool read(FloatSamples& out) {
        if (!stream_) return false;

        out.resize(static_cast<size_t>(frame_samples_));
        PaError err = Pa_ReadStream(stream_, out.data(), static_cast<unsigned long>(frame_samples_));
        if (err == paInputOverflowed) {
            Logger::warn("Input overflow");
        } else if (err != paNoError) {
            Logger::error("Input stream read failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        return true;
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    bool is_open() const {
        return stream_ != nullptr;
    }

private:
    std::string device_name_;
    PaStream* stream_;
    bool initialized_;
    int frame_samples_;
};

PortAudioCaptureDevice::PortAudioCaptureDevice(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}
PortAudioCaptureDevice::~PortAudioCaptureDevice() = default;

Result<void> PortAudioCaptureDevice::open(int sample_rate, int frame_samples) {
    return pimpl_->open(sample_rate, frame_samples);
}

bool PortAudioCaptureDevice::read(FloatSamples& out) {
    return pimpl_->read(out);
}

void PortAudioCaptureDevice::close() {
    pimpl_->close();
}

bool PortAudioCaptureDevice::is_open() const {
    return pimpl_->is_open();
}

// =============================================================================
// Output
// =============================================================================

class PortAudioOutputDevice::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), initialized_(false),
          sample_rate_(DEFAULT_OUTPUT_SAMPLE_RATE), rendered_frames_(0), late_frames_(0) {}

    ~Impl() {
        close();
    }

    Result<void> open(int sample_rate) {
        if (stream_) {
            return make_error(ErrorType::InvalidState, "output device already open");
        }
        sample_rate_ = sample_rate;
        rendered_frames_ = 0;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        initialized_ = true;

        PaDeviceIndex output_idx = find_device(device_name_, false);
        if (output_idx == paNoDevice) {
            close();
            return make_device_error("Output device not found: " + device_name_);
        }
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!output_info || output_info->maxOutputChannels <= 0) {
            close();
            return make_device_error("Device '" + device_name_ + "' has no output channels");
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paFloat32;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, nullptr, &output_params, sample_rate_,
                            paFramesPerBufferUnspecified, paClipOff, audio_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Error e = classify_stream_error(err, "Failed to open output stream");
            close();
            return make_device_error(e.message);
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Error e = classify_stream_error(err, "Failed to start output stream");
            close();
            return make_device_error(e.message);
        }

        std::ostringstream oss;
        oss << "Using output device: [" << output_idx << "] " << output_info->name
            << " @ " << sample_rate_ << " Hz";
        Logger::info(oss.str());
        return {};
    }

    double now() const {
        return static_cast<double>(rendered_frames_.load(std::memory_order_acquire)) / sample_rate_;
    }

    void schedule(DecodedAudioBuffer buffer, double start_time) {
        if (buffer.sample_rate != sample_rate_) {
            Logger::warn("Scheduled buffer at " + std::to_string(buffer.sample_rate) +
                         " Hz on a " + std::to_string(sample_rate_) + " Hz stream; pitch will be off");
        }
        timeline_.schedule(std::move(buffer.samples),
                           static_cast<int64_t>(std::llround(start_time * sample_rate_)));
    }

    void cancel_pending() {
        timeline_.cancel_pending();
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
        timeline_.clear();
        uint64_t late = late_frames_.exchange(0);
        if (late > 0) {
            Logger::debug("Output skipped " + std::to_string(late) + " late frames");
        }
    }

    bool is_open() const {
        return stream_ != nullptr;
    }

private:
    static int audio_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        const int64_t window_start = static_cast<int64_t>(self->rendered_frames_.load(std::memory_order_relaxed));
        uint64_t late = self->timeline_.render(static_cast<float*>(output), frame_count, window_start);
        if (late > 0) {
            self->late_frames_.fetch_add(late, std::memory_order_relaxed);
        }
        self->rendered_frames_.fetch_add(frame_count, std::memory_order_release);
        return paContinue;
    }

    std::string device_name_;
    PaStream* stream_;
    bool initialized_;
    int sample_rate_;
    std::atomic<uint64_t> rendered_frames_;
    std::atomic<uint64_t> late_frames_;
    OutputTimeline timeline_;
};

PortAudioOutputDevice::PortAudioOutputDevice(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}
PortAudioOutputDevice::~PortAudioOutputDevice() = default;

Result<void> PortAudioOutputDevice::open(int sample_rate) {
    return pimpl_->open(sample_rate);
}

double PortAudioOutputDevice::now() const {
    return pimpl_->now();
}

void PortAudioOutputDevice::schedule(DecodedAudioBuffer buffer, double start_time) {
    pimpl_->schedule(std::move(buffer), start_time);
}

void PortAudioOutputDevice::cancel_pending() {
    pimpl_->cancel_pending();
}

void PortAudioOutputDevice::close() {
    pimpl_->close();
}

bool PortAudioOutputDevice::is_open() const {
    return pimpl_->is_open();
}

void list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (i == Pa_GetDefaultInputDevice()) oss << " [default input]";
        if (i == Pa_GetDefaultOutputDevice()) oss << " [default output]";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

} // namespace audio
} // namespace duplex_voice
