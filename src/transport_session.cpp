#include "transport_session.h"
#include "core/bounded_queue.h"
#include "frame_codec.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

namespace duplex_voice {

namespace {

constexpr int RECEIVE_SLICE_MS = 100;

Error classify_remote_close(int close_code) {
    std::string text = "remote closed the connection (code " + std::to_string(close_code) + ")";
    if (close_code == net::CLOSE_POLICY_VIOLATION) {
        return make_auth_error(text);
    }
    return make_network_error(text);
}

Error classify_remote_error(const std::string& message) {
    if (net::is_auth_message(message)) {
        return make_auth_error("remote error: " + message);
    }
    return make_protocol_error("remote error: " + message);
}

} // anonymous namespace

class TransportSession::Impl {
public:
    Impl(std::unique_ptr<net::IChannel> channel, std::unique_ptr<net::IMessageCodec> codec,
         const TransportConfig& transport_config, const AudioConfig& audio_config)
        : channel_(std::move(channel)), codec_(std::move(codec)),
          config_(transport_config), audio_(audio_config),
          send_queue_(static_cast<size_t>(transport_config.send_queue_frames > 0
                                              ? transport_config.send_queue_frames : 1)),
          running_(false), accepting_(false), closing_(false), connecting_(false), failed_(false),
          frames_sent_(0), frames_dropped_(0), decode_errors_(0) {}

    ~Impl() {
        close();
        // close() issued from one of our own threads leaves that join to us
        if (sender_.joinable()) sender_.join();
        if (receiver_.joinable()) receiver_.join();
    }

    Result<ChannelInfo> connect(const std::string& instruction, const std::string& voice_id,
                                TransportHandlers handlers) {
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (running_ || closing_ || connecting_) {
                return make_error(ErrorType::InvalidState, "transport session already used");
            }
            if (!channel_ || !codec_) {
                return make_error(ErrorType::InvalidState, "transport has no channel or codec");
            }
            connecting_ = true;
        }

        // The handshake runs unlocked so close() can abort it from another thread
        auto start = std::chrono::steady_clock::now();
        auto result = handshake(instruction, voice_id);

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        connecting_ = false;
        if (result.is_ok() && closing_) {
            result = make_network_error("transport closed during connect");
        }
        if (result.is_error()) {
            channel_->close();
            Logger::error("Transport connect failed: " + result.error().describe());
            return result.error();
        }

        handlers_ = std::move(handlers);
        running_ = true;
        accepting_ = true;
        sender_ = std::thread(&Impl::sender_loop, this);
        receiver_ = std::thread(&Impl::receiver_loop, this);

        ChannelInfo info;
        info.protocol = codec_->name();
        info.voice_id = voice_id;
        info.handshake_ms = ms_since(start);
        LOG_TRANSPORT("Session ready (" + info.protocol + ", voice " + voice_id + ", " +
                      std::to_string(info.handshake_ms) + " ms)");
        return info;
    }

    void send(AudioFrame frame) {
        if (!accepting_) {
            return;
        }
        uint64_t sequence = frame.sequence;
        if (!send_queue_.try_push(std::move(frame))) {
            if (!accepting_) {
                return;  // closed while we were pushing
            }
            uint64_t dropped = ++frames_dropped_;
            Logger::warn("Send queue full, dropped frame " + std::to_string(sequence) +
                         " (" + std::to_string(dropped) + " dropped so far)");
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        accepting_ = false;
        closing_ = true;
        bool was_running = running_.exchange(false);

        send_queue_.clear();
        send_queue_.close();
        if (channel_) {
            channel_->close();
        }

        auto self = std::this_thread::get_id();
        if (sender_.joinable() && sender_.get_id() != self) {
            sender_.join();
        }
        if (receiver_.joinable() && receiver_.get_id() != self) {
            receiver_.join();
        }
        if (was_running) {
            LOG_TRANSPORT("Transport closed (" + std::to_string(frames_sent_.load()) + " frames sent, " +
                          std::to_string(frames_dropped_.load()) + " dropped)");
        }
    }

    bool is_connected() const {
        return running_;
    }

    bool channel_open() const {
        return channel_ && channel_->is_open();
    }

    uint64_t frames_sent() const { return frames_sent_; }
    uint64_t frames_dropped() const { return frames_dropped_; }
    uint64_t decode_errors() const { return decode_errors_; }

private:
    Result<void> handshake(const std::string& instruction, const std::string& voice_id) {
        auto opened = channel_->open(codec_->connect_url(config_), codec_->connect_headers(config_),
                                     config_.connect_timeout_ms);
        if (opened.is_error()) {
            return opened;
        }

        net::SetupRequest request;
        request.behavior_instruction = instruction;
        request.voice_id = voice_id;
        request.model = config_.model;
        request.input_sample_rate = audio_.input_sample_rate;
        request.input_transcription = config_.input_transcription;
        request.output_transcription = config_.output_transcription;

        auto sent = channel_->send_text(codec_->encode_setup(request));
        if (sent.is_error()) {
            return make_network_error("setup not sent: " + sent.error().message);
        }
        return await_ready();
    }

    Result<void> await_ready() {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.handshake_timeout_ms);
        std::string message;

        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return make_protocol_error("no setup acknowledgement within " +
                                           std::to_string(config_.handshake_timeout_ms) + " ms");
            }
            int left = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

            auto received = channel_->receive(message, left);
            if (received.is_error()) {
                return make_network_error("dropped during handshake: " + received.error().message);
            }
            if (received.value() == net::ReceiveStatus::Timeout) {
                continue;
            }
            if (received.value() == net::ReceiveStatus::Closed) {
                return classify_remote_close(channel_->close_code());
            }

            auto decoded = codec_->decode(message);
            if (decoded.is_error()) {
                return make_protocol_error("malformed handshake reply: " + decoded.error().message);
            }
            for (const auto& ev : decoded.value()) {
                switch (ev.kind) {
                    case net::InboundKind::Ready:
                        return {};
                    case net::InboundKind::Error:
                        return classify_remote_error(ev.message);
                    case net::InboundKind::Closed:
                        return make_network_error("remote closed during handshake: " + ev.message);
                    default:
                        return make_protocol_error("unexpected reply before setup acknowledgement: " +
                                                   utils::truncate_for_log(message, 60));
                }
            }
            // Empty classification (e.g. usage metadata): keep waiting
        }
    }

    void sender_loop() {
        Logger::set_thread_name("send");
        AudioFrame frame;
        while (send_queue_.pop(frame)) {
            auto sent = channel_->send_text(codec_->encode_audio(frame));
            if (sent.is_error()) {
                report_failure(make_network_error("send failed: " + sent.error().message));
                break;
            }
            frames_sent_++;
        }
    }

    void receiver_loop() {
        Logger::set_thread_name("recv");
        std::string message;
        while (running_) {
            auto received = channel_->receive(message, RECEIVE_SLICE_MS);
            if (received.is_error()) {
                report_failure(make_network_error("channel dropped: " + received.error().message));
                break;
            }
            if (received.value() == net::ReceiveStatus::Timeout) {
                continue;
            }
            if (received.value() == net::ReceiveStatus::Closed) {
                report_failure(classify_remote_close(channel_->close_code()));
                break;
            }
            if (!dispatch(message)) {
                break;
            }
        }
    }

    /// @return False once the session is over
    bool dispatch(const std::string& message) {
        auto decoded = codec_->decode(message);
        if (decoded.is_error()) {
            Logger::warn("Ignoring malformed message: " + decoded.error().message);
            return true;
        }

        for (auto& ev : decoded.value()) {
            switch (ev.kind) {
                case net::InboundKind::Ready:
                    break;
                case net::InboundKind::Audio: {
                    auto buffer = codec::decode_audio_chunk(ev.audio_base64, audio_.output_sample_rate);
                    if (buffer.is_error()) {
                        decode_errors_++;
                        Logger::warn("Dropping audio chunk: " + buffer.error().describe());
                        break;
                    }
                    if (handlers_.on_audio) {
                        handlers_.on_audio(std::move(buffer.value()));
                    }
                    break;
                }
                case net::InboundKind::Transcript:
                    if (handlers_.on_transcript) {
                        handlers_.on_transcript(ev.fragment);
                    }
                    break;
                case net::InboundKind::Interrupted:
                    LOG_TRANSPORT("Remote turn interrupted");
                    if (handlers_.on_interrupted) {
                        handlers_.on_interrupted();
                    }
                    break;
                case net::InboundKind::Closed:
                    report_failure(make_network_error(
                        "remote closed the session" + (ev.message.empty() ? "" : ": " + ev.message)));
                    return false;
                case net::InboundKind::Error:
                    report_failure(classify_remote_error(ev.message));
                    return false;
            }
        }
        return true;
    }

    void report_failure(const Error& error) {
        accepting_ = false;
        running_ = false;
        if (closing_ || failed_.exchange(true)) {
            return;
        }
        Logger::error("Transport failure: " + error.describe());
        if (handlers_.on_failure) {
            handlers_.on_failure(error);
        }
    }

    std::unique_ptr<net::IChannel> channel_;
    std::unique_ptr<net::IMessageCodec> codec_;
    TransportConfig config_;
    AudioConfig audio_;
    TransportHandlers handlers_;

    std::mutex lifecycle_mutex_;
    BoundedQueue<AudioFrame> send_queue_;
    std::thread sender_;
    std::thread receiver_;
    std::atomic<bool> running_;
    std::atomic<bool> accepting_;
    std::atomic<bool> closing_;
    bool connecting_;
    std::atomic<bool> failed_;

    std::atomic<uint64_t> frames_sent_;
    std::atomic<uint64_t> frames_dropped_;
    std::atomic<uint64_t> decode_errors_;
};

TransportSession::TransportSession(std::unique_ptr<net::IChannel> channel,
                                   std::unique_ptr<net::IMessageCodec> codec,
                                   const TransportConfig& transport_config,
                                   const AudioConfig& audio_config)
    : pimpl_(std::make_unique<Impl>(std::move(channel), std::move(codec), transport_config, audio_config)) {}
TransportSession::~TransportSession() = default;

Result<ChannelInfo> TransportSession::connect(const std::string& behavior_instruction,
                                              const std::string& voice_id,
                                              TransportHandlers handlers) {
    return pimpl_->connect(behavior_instruction, voice_id, std::move(handlers));
}

void TransportSession::send(AudioFrame frame) {
    pimpl_->send(std::move(frame));
}

void TransportSession::close() {
    pimpl_->close();
}

bool TransportSession::is_connected() const {
    return pimpl_->is_connected();
}

bool TransportSession::channel_open() const {
    return pimpl_->channel_open();
}

uint64_t TransportSession::frames_sent() const {
    return pimpl_->frames_sent();
}

uint64_t TransportSession::frames_dropped() const {
    return pimpl_->frames_dropped();
}

uint64_t TransportSession::decode_errors() const {
    return pimpl_->decode_errors();
}

} // namespace duplex_voice
