#include "playback_scheduler.h"
#include "core/bounded_queue.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

namespace duplex_voice {

namespace {

struct PlaybackCommand {
    enum class Kind { Enqueue, Reset };
    Kind kind = Kind::Enqueue;
    DecodedAudioBuffer buffer;
};

} // anonymous namespace

class PlaybackScheduler::Impl {
public:
    Impl(std::unique_ptr<audio::IOutputDevice> device, int sample_rate, size_t queue_capacity)
        : device_(std::move(device)), sample_rate_(sample_rate),
          commands_(std::make_unique<BoundedQueue<PlaybackCommand>>(queue_capacity)),
          queue_capacity_(queue_capacity), running_(false),
          posted_(0), processed_(0), buffers_scheduled_(0), buffers_dropped_(0) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_) {
            return {};
        }
        if (!device_) {
            return make_device_error("no output device");
        }

        auto opened = device_->open(sample_rate_);
        if (opened.is_error()) {
            device_->close();
            Logger::error("Output device unavailable: " + opened.error().describe());
            return opened;
        }

        commands_ = std::make_unique<BoundedQueue<PlaybackCommand>>(queue_capacity_);
        cursor_.reset();
        running_ = true;
        worker_ = std::thread(&Impl::worker_loop, this);
        LOG_PLAYBACK("Playback started @ " + std::to_string(sample_rate_) + " Hz");
        return {};
    }

    bool enqueue(DecodedAudioBuffer buffer) {
        if (!running_) {
            return false;
        }
        PlaybackCommand cmd;
        cmd.kind = PlaybackCommand::Kind::Enqueue;
        cmd.buffer = std::move(buffer);
        // Never stall the receive loop: a full queue costs one chunk of audio
        if (!post(std::move(cmd), false)) {
            if (commands_->closed()) {
                return false;  // stop() won the race
            }
            uint64_t dropped = ++buffers_dropped_;
            Logger::warn("Playback queue full, dropping audio chunk (" + std::to_string(dropped) +
                         " dropped so far)");
            return false;
        }
        return true;
    }

    void reset() {
        if (!running_) {
            cursor_.reset();
            return;
        }
        // Buffers still queued are "not yet started" too
        mark_processed(commands_->clear());
        PlaybackCommand cmd;
        cmd.kind = PlaybackCommand::Kind::Reset;
        post(std::move(cmd), true);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        bool was_running = running_.exchange(false);
        if (was_running) {
            commands_->clear();
            commands_->close();
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        {
            std::lock_guard<std::mutex> idle_lock(idle_mutex_);
            processed_ = posted_;
        }
        idle_cv_.notify_all();

        if (device_ && device_->is_open()) {
            device_->cancel_pending();
            device_->close();
            LOG_PLAYBACK("Output device released");
        }
        cursor_.reset();
        if (was_running) {
            LOG_PLAYBACK("Playback stopped after " + std::to_string(buffers_scheduled_.load()) + " buffers");
        }
    }

    void wait_until_idle() {
        std::unique_lock<std::mutex> lock(idle_mutex_);
        idle_cv_.wait(lock, [this] { return processed_ >= posted_ || !running_; });
    }

    bool is_running() const {
        return running_;
    }

    bool device_open() const {
        return device_ && device_->is_open();
    }

    uint64_t buffers_scheduled() const {
        return buffers_scheduled_;
    }

    uint64_t buffers_dropped() const {
        return buffers_dropped_;
    }

private:
    bool post(PlaybackCommand cmd, bool wait_for_space) {
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            posted_++;
        }
        bool queued = wait_for_space ? commands_->push(std::move(cmd))
                                     : commands_->try_push(std::move(cmd));
        if (!queued) {
            mark_processed();
        }
        return queued;
    }

    void mark_processed(uint64_t count = 1) {
        if (count == 0) return;
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            processed_ += count;
        }
        idle_cv_.notify_all();
    }

    void worker_loop() {
        Logger::set_thread_name("playback");
        PlaybackCommand cmd;
        while (commands_->pop(cmd)) {
            if (cmd.kind == PlaybackCommand::Kind::Reset) {
                cursor_.reset();
                device_->cancel_pending();
                LOG_PLAYBACK("Cursor reset, pending buffers discarded");
            } else if (!cmd.buffer.empty()) {
                schedule(std::move(cmd.buffer));
            }
            mark_processed();
        }
    }

    void schedule(DecodedAudioBuffer buffer) {
        double now = device_->now();
        double duration = buffer.duration_seconds();
        bool underrun = cursor_.initialized() && cursor_.next_start_time() < now;
        double start = cursor_.schedule(now, duration);

        if (underrun) {
            std::ostringstream oss;
            oss << "Underrun: resynced cursor to device time " << now;
            LOG_PLAYBACK(oss.str());
        }
        device_->schedule(std::move(buffer), start);
        buffers_scheduled_++;
    }

    std::unique_ptr<audio::IOutputDevice> device_;
    int sample_rate_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<BoundedQueue<PlaybackCommand>> commands_;
    size_t queue_capacity_;
    std::thread worker_;
    std::atomic<bool> running_;

    // Worker thread only (and stop() after the join)
    PlaybackCursor cursor_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    uint64_t posted_;
    uint64_t processed_;
    std::atomic<uint64_t> buffers_scheduled_;
    std::atomic<uint64_t> buffers_dropped_;
};

PlaybackScheduler::PlaybackScheduler(std::unique_ptr<audio::IOutputDevice> device, int sample_rate,
                                     size_t queue_capacity)
    : pimpl_(std::make_unique<Impl>(std::move(device), sample_rate, queue_capacity)) {}
PlaybackScheduler::~PlaybackScheduler() = default;

Result<void> PlaybackScheduler::start() {
    return pimpl_->start();
}

bool PlaybackScheduler::enqueue(DecodedAudioBuffer buffer) {
    return pimpl_->enqueue(std::move(buffer));
}

void PlaybackScheduler::reset() {
    pimpl_->reset();
}

void PlaybackScheduler::stop() {
    pimpl_->stop();
}

void PlaybackScheduler::wait_until_idle() {
    pimpl_->wait_until_idle();
}

bool PlaybackScheduler::is_running() const {
    return pimpl_->is_running();
}

bool PlaybackScheduler::device_open() const {
    return pimpl_->device_open();
}

uint64_t PlaybackScheduler::buffers_scheduled() const {
    return pimpl_->buffers_scheduled();
}

uint64_t PlaybackScheduler::buffers_dropped() const {
    return pimpl_->buffers_dropped();
}

} // namespace duplex_voice
