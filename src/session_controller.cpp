#include "session_controller.h"
#include "audio_capture.h"
#include "logger.h"
#include "playback_scheduler.h"
#include "state_machine.h"
#include "transcript_aggregator.h"
#include "transport_session.h"
#include "net/wire_protocol.h"
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace duplex_voice {

namespace {

/**
 * Everything one connect() acquires. Threads inside hold a raw pointer back
 * here, so the destructor stops them before any member goes away.
 */
struct ActiveSession {
    uint64_t generation = 0;
    std::unique_ptr<AudioCaptureStage> capture;
    std::unique_ptr<PlaybackScheduler> playback;
    std::unique_ptr<TransportSession> transport;

    std::mutex transcript_mutex;
    TranscriptAggregator aggregator;

    ~ActiveSession() {
        if (capture) capture->stop();
        if (playback) playback->stop();
        if (transport) transport->close();
    }
};

/// Run one teardown step; a failing step must not stop the rest
void run_step(const char* name, const std::function<void()>& step) {
    try {
        step();
    } catch (const std::exception& e) {
        Logger::error(std::string("Teardown step '") + name + "' failed: " + e.what());
    }
}

/// Microphone first, then output device, then the channel
void teardown(ActiveSession& session) {
    run_step("capture", [&] { session.capture->stop(); });
    run_step("playback", [&] { session.playback->stop(); });
    run_step("transport", [&] { session.transport->close(); });
    run_step("transcript", [&] {
        std::lock_guard<std::mutex> lock(session.transcript_mutex);
        session.aggregator.reset();
    });
}

} // anonymous namespace

class SessionController::Impl {
public:
    Impl(const Config& config, std::shared_ptr<ISessionBackend> backend)
        : config_(config), backend_(std::move(backend)),
          events_(static_cast<size_t>(config.session.event_queue_size > 0 ? config.session.event_queue_size : 1)),
          generation_(0) {
        if (!backend_) {
            throw std::invalid_argument("SessionController needs a backend");
        }
    }

    ~Impl() {
        disconnect();
        std::thread stale;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = std::move(worker_);
        }
        if (stale.joinable()) {
            stale.join();
        }
    }

    Result<void> connect(const std::string& instruction) {
        // A finished instance may still be tearing down after an async failure
        std::thread stale;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            throw_if_active();
            stale = std::move(worker_);
        }
        if (stale.joinable()) {
            stale.join();
        }

        std::shared_ptr<ActiveSession> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            throw_if_active();

            session_.reset();
            machine_.reset();
            machine_.begin_connect();
            last_error_ = Error();
            events_.publish(SessionEvent::status_changed(SessionState::Connecting));

            auto valid = config_.validate();
            if (valid.is_error()) {
                return fail_locked(valid.error());
            }
            auto codec = net::make_message_codec(config_.transport.protocol);
            if (!codec) {
                return fail_locked(make_config_error("unknown transport protocol: " + config_.transport.protocol));
            }

            session = std::make_shared<ActiveSession>();
            session->generation = ++generation_;
            session->capture = std::make_unique<AudioCaptureStage>(
                backend_->create_capture_device(config_.audio), config_.audio);
            session->playback = std::make_unique<PlaybackScheduler>(
                backend_->create_output_device(config_.audio), config_.audio.output_sample_rate,
                static_cast<size_t>(config_.session.playback_queue_size));
            session->transport = std::make_unique<TransportSession>(
                backend_->create_channel(config_.transport), std::move(codec), config_.transport, config_.audio);
            session_ = session;
        }

        LOG_SESSION("Acquiring microphone");
        auto mic = session->capture->open();
        if (mic.is_error()) {
            return abort_connect(session, mic.error());
        }

        LOG_SESSION("Starting playback");
        auto playback = session->playback->start();
        if (playback.is_error()) {
            return abort_connect(session, playback.error());
        }

        LOG_SESSION("Connecting transport");
        auto channel = session->transport->connect(instruction, config_.transport.voice_id,
                                                   make_transport_handlers(session));
        if (channel.is_error()) {
            return abort_connect(session, channel.error());
        }

        ActiveSession* s = session.get();
        uint64_t generation = session->generation;
        auto capture = session->capture->start(
            [this, s](AudioFrame frame, float level) {
                s->transport->send(std::move(frame));
                events_.publish(SessionEvent::audio_level(level));
            },
            [this, generation](const Error& error) {
                handle_async_failure(generation, error);
            });
        if (capture.is_error()) {
            return abort_connect(session, capture.error());
        }

        Error lost;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ == generation && machine_.get_state() == SessionState::Connecting) {
                machine_.on_connected();
                events_.publish(SessionEvent::status_changed(SessionState::Connected));
                LOG_SESSION("Connected (" + channel.value().protocol + ")");
                return {};
            }
            // disconnect() or an async failure got there first
            lost = last_error_.is_error() ? last_error_
                                          : make_error(ErrorType::InvalidState, "connect cancelled by disconnect");
        }
        teardown(*session);
        return lost;
    }

    void disconnect() {
        std::thread stale;
        std::shared_ptr<ActiveSession> session;
        bool transitioned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = std::move(worker_);
            if (machine_.get_state() == SessionState::Idle) {
                machine_.on_disconnect();
                events_.publish(SessionEvent::status_changed(SessionState::Disconnected));
            } else {
                transitioned = machine_.is_active() && machine_.on_disconnect();
                session = session_;
            }
        }

        if (stale.joinable()) {
            stale.join();
        }
        if (session) {
            teardown(*session);
        }
        if (transitioned) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.publish(SessionEvent::status_changed(SessionState::Disconnected));
            LOG_SESSION("Disconnected");
        }
    }

    SessionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.get_state();
    }

    bool is_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.is_active();
    }

    SessionResources resources() const {
        std::shared_ptr<ActiveSession> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session = session_;
        }
        SessionResources r;
        if (!session) {
            return r;
        }
        r.microphone_open = session->capture->device_open();
        r.capture_running = session->capture->is_running();
        r.output_open = session->playback->device_open();
        r.playback_running = session->playback->is_running();
        r.channel_open = session->transport->channel_open();
        return r;
    }

    Error last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    bool poll_event(SessionEvent& out, std::chrono::milliseconds timeout) {
        return events_.poll(out, timeout);
    }

    size_t pending_events() const {
        return events_.size();
    }

    const Config& config() const {
        return config_;
    }

private:
    void throw_if_active() const {
        if (machine_.is_active()) {
            throw SessionActiveError(std::string("a session is already ") +
                                     session_state_name(machine_.get_state()));
        }
    }

    Error fail_locked(const Error& error) {
        machine_.on_failure();
        last_error_ = error;
        events_.publish(SessionEvent::status_changed(SessionState::Error, error.describe()));
        Logger::error("Connect failed: " + error.describe());
        return error;
    }

    Result<void> abort_connect(const std::shared_ptr<ActiveSession>& session, const Error& error) {
        teardown(*session);
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == session->generation && machine_.get_state() == SessionState::Connecting) {
            return fail_locked(error);
        }
        return last_error_.is_error() ? last_error_ : error;
    }

    TransportHandlers make_transport_handlers(const std::shared_ptr<ActiveSession>& session) {
        ActiveSession* s = session.get();
        uint64_t generation = session->generation;

        TransportHandlers handlers;
        handlers.on_audio = [s](DecodedAudioBuffer buffer) {
            s->playback->enqueue(std::move(buffer));
        };
        handlers.on_transcript = [this, s](const TranscriptFragment& fragment) {
            std::vector<TranscriptUpdate> updates;
            {
                std::lock_guard<std::mutex> lock(s->transcript_mutex);
                updates = s->aggregator.append(fragment);
            }
            for (const auto& update : updates) {
                events_.publish(SessionEvent::transcript(update.text, update.speaker == Speaker::Local,
                                                         update.turn_complete));
            }
        };
        handlers.on_interrupted = [s]() {
            s->playback->reset();
        };
        handlers.on_failure = [this, generation](const Error& error) {
            handle_async_failure(generation, error);
        };
        return handlers;
    }

    /**
     * Runs on a capture or transport thread. Teardown joins those threads, so
     * it happens on a separate worker, which publishes Error once done.
     */
    void handle_async_failure(uint64_t generation, const Error& error) {
        std::thread previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_ || !machine_.is_active()) {
                return;
            }
            machine_.on_failure();
            last_error_ = error;
            Logger::error("Session failed: " + error.describe());

            std::shared_ptr<ActiveSession> session = session_;
            previous = std::move(worker_);
            worker_ = std::thread([this, session, error]() {
                Logger::set_thread_name("teardown");
                teardown(*session);
                events_.publish(SessionEvent::status_changed(SessionState::Error, error.describe()));
            });
        }
        if (previous.joinable()) {
            previous.join();
        }
    }

    Config config_;
    std::shared_ptr<ISessionBackend> backend_;
    EventQueue events_;

    mutable std::mutex mutex_;
    SessionStateMachine machine_;
    std::shared_ptr<ActiveSession> session_;
    uint64_t generation_;
    Error last_error_;
    std::thread worker_;
};

SessionController::SessionController(const Config& config, std::shared_ptr<ISessionBackend> backend)
    : pimpl_(std::make_unique<Impl>(config, std::move(backend))) {}
SessionController::~SessionController() = default;

Result<void> SessionController::connect(const std::string& behavior_instruction) {
    return pimpl_->connect(behavior_instruction);
}

void SessionController::disconnect() {
    pimpl_->disconnect();
}

SessionState SessionController::state() const {
    return pimpl_->state();
}

bool SessionController::is_active() const {
    return pimpl_->is_active();
}

SessionResources SessionController::resources() const {
    return pimpl_->resources();
}

Error SessionController::last_error() const {
    return pimpl_->last_error();
}

bool SessionController::poll_event(SessionEvent& out, std::chrono::milliseconds timeout) {
    return pimpl_->poll_event(out, timeout);
}

size_t SessionController::pending_events() const {
    return pimpl_->pending_events();
}

const Config& SessionController::config() const {
    return pimpl_->config();
}

} // namespace duplex_voice
