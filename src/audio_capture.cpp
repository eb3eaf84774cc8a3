#include "audio_capture.h"
#include "frame_codec.h"
#include "logger.h"
#include <atomic>
#include <mutex>
#include <thread>

namespace duplex_voice {

namespace {

/// Closes the device on scope exit unless released
class DeviceLease {
public:
    explicit DeviceLease(audio::ICaptureDevice* device) : device_(device) {}
    ~DeviceLease() {
        if (device_) device_->close();
    }
    DeviceLease(const DeviceLease&) = delete;
    DeviceLease& operator=(const DeviceLease&) = delete;

    void release() { device_ = nullptr; }

private:
    audio::ICaptureDevice* device_;
};

} // anonymous namespace

class AudioCaptureStage::Impl {
public:
    Impl(std::unique_ptr<audio::ICaptureDevice> device, const AudioConfig& config)
        : device_(std::move(device)), config_(config), running_(false),
          next_sequence_(0), frames_captured_(0) {}

    ~Impl() {
        stop();
        // A stop() issued from the capture thread itself leaves the join to us
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Result<void> open() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        return open_locked();
    }

    Result<void> start(FrameSink sink, ErrorHandler on_error) {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_) {
            return make_error(ErrorType::InvalidState, "capture already running");
        }
        if (thread_.joinable()) {
            thread_.join();
        }

        // Only open() acquires the microphone; a stop() that got here first wins
        if (!device_ || !device_->is_open()) {
            return make_error(ErrorType::InvalidState, "microphone not open");
        }

        sink_ = std::move(sink);
        on_error_ = std::move(on_error);
        next_sequence_ = 0;
        running_ = true;
        thread_ = std::thread(&Impl::capture_loop, this);
        LOG_CAPTURE("Capture started (" + std::to_string(config_.frame_samples) + " samples/frame @ " +
                    std::to_string(config_.input_sample_rate) + " Hz)");
        return {};
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        bool was_running = running_.exchange(false);

        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
        if (device_ && device_->is_open()) {
            device_->close();
            LOG_CAPTURE("Microphone released");
        }
        if (was_running) {
            LOG_CAPTURE("Capture stopped after " + std::to_string(frames_captured_.load()) + " frames");
        }
    }

    bool is_running() const {
        return running_;
    }

    bool device_open() const {
        return device_ && device_->is_open();
    }

    uint64_t frames_captured() const {
        return frames_captured_;
    }

private:
    Result<void> open_locked() {
        if (!device_) {
            return make_device_error("no capture device");
        }
        if (device_->is_open()) {
            return {};
        }

        DeviceLease lease(device_.get());
        auto result = device_->open(config_.input_sample_rate, config_.frame_samples);
        if (result.is_error()) {
            Logger::error("Microphone unavailable: " + result.error().describe());
            return result;
        }
        lease.release();
        LOG_CAPTURE("Microphone acquired");
        return {};
    }

    void capture_loop() {
        Logger::set_thread_name("capture");
        FloatSamples block;
        while (running_) {
            if (!device_->read(block)) {
                // Device failed underneath us; a stop() in progress is not an error
                if (running_.exchange(false)) {
                    Logger::error("Capture device stopped delivering audio");
                    if (on_error_) {
                        on_error_(make_device_error("capture device stopped delivering audio"));
                    }
                }
                break;
            }
            if (!running_) {
                break;
            }

            AudioFrame frame;
            frame.samples = codec::float_to_pcm16(block);
            frame.sample_rate = config_.input_sample_rate;
            frame.channels = CHANNELS;
            frame.sequence = next_sequence_++;
            float level = codec::compute_rms(block);

            frames_captured_++;
            sink_(std::move(frame), level);
        }
    }

    std::unique_ptr<audio::ICaptureDevice> device_;
    AudioConfig config_;

    std::mutex lifecycle_mutex_;
    std::thread thread_;
    std::atomic<bool> running_;
    FrameSink sink_;
    ErrorHandler on_error_;
    uint64_t next_sequence_;
    std::atomic<uint64_t> frames_captured_;
};

AudioCaptureStage::AudioCaptureStage(std::unique_ptr<audio::ICaptureDevice> device, const AudioConfig& config)
    : pimpl_(std::make_unique<Impl>(std::move(device), config)) {}
AudioCaptureStage::~AudioCaptureStage() = default;

Result<void> AudioCaptureStage::open() {
    return pimpl_->open();
}

Result<void> AudioCaptureStage::start(FrameSink sink, ErrorHandler on_error) {
    return pimpl_->start(std::move(sink), std::move(on_error));
}

void AudioCaptureStage::stop() {
    pimpl_->stop();
}

bool AudioCaptureStage::is_running() const {
    return pimpl_->is_running();
}

bool AudioCaptureStage::device_open() const {
    return pimpl_->device_open();
}

uint64_t AudioCaptureStage::frames_captured() const {
    return pimpl_->frames_captured();
}

} // namespace duplex_voice
