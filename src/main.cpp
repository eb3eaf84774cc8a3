#include "session_controller.h"
#include "audio/portaudio_devices.h"
#include "config.h"
#include "logger.h"
#include <signal.h>
#include <csignal>
#include <unistd.h>
#include <atomic>
#include <fstream>
#include <iostream>
#include <string>

namespace duplex_voice {

static std::atomic<bool> g_stop_requested(false);

void signal_handler(int) {
    g_stop_requested = true;
}

std::string level_meter(float level) {
    const int width = 20;
    int filled = static_cast<int>(level * width + 0.5f);
    return std::string(filled, '#') + std::string(width - filled, '.');
}

} // namespace duplex_voice

int main(int argc, char* argv[]) {
    duplex_voice::Logger::initialize(duplex_voice::LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        duplex_voice::audio::list_devices();
        duplex_voice::Logger::shutdown();
        return 0;
    }

    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    } else {
        // Try config next to the executable (e.g. build/../config)
        char buf[1024];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len != -1) {
            buf[len] = '\0';
            std::string exe_dir(buf);
            size_t pos = exe_dir.find_last_of('/');
            if (pos != std::string::npos) {
                std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
                std::ifstream test(candidate);
                if (test.good()) {
                    config_path = candidate;
                }
            }
        }
    }

    auto loaded = duplex_voice::Config::load_from_file(config_path);
    if (loaded.is_error()) {
        duplex_voice::Logger::error(loaded.error().describe());
        duplex_voice::Logger::shutdown();
        return 1;
    }
    duplex_voice::Config config = loaded.value();

    // Re-open the logger with the configured level and file
    duplex_voice::Logger::shutdown();
    duplex_voice::Logger::initialize(duplex_voice::Logger::parse_level(config.logging.level), config.logging.file);

    std::string instruction = config.session.default_instruction;
    if (argc > 2) {
        instruction = argv[2];
    }

    std::signal(SIGINT, duplex_voice::signal_handler);
    std::signal(SIGTERM, duplex_voice::signal_handler);

    duplex_voice::SessionController session(config, std::make_shared<duplex_voice::DefaultSessionBackend>());

    bool session_over = false;
    duplex_voice::SessionCallbacks callbacks;
    callbacks.on_status_change = [&](duplex_voice::SessionState status, const std::string& message) {
        std::string line = std::string("Status: ") + duplex_voice::session_state_name(status);
        if (!message.empty()) {
            line += " (" + message + ")";
        }
        duplex_voice::Logger::info(line);
        if (status == duplex_voice::SessionState::Error || status == duplex_voice::SessionState::Disconnected) {
            session_over = true;
        }
    };
    callbacks.on_transcript_update = [](const std::string& text, bool is_local) {
        std::cout << "\r" << (is_local ? "[you]   " : "[agent] ") << text << std::endl;
    };
    callbacks.on_audio_level = [](float level) {
        std::cout << "\rmic " << duplex_voice::level_meter(level) << std::flush;
    };

    auto connected = session.connect(instruction);
    if (connected.is_error()) {
        duplex_voice::SessionEvent event;
        while (session.poll_event(event, std::chrono::milliseconds(0))) {
            duplex_voice::dispatch_event(event, callbacks);
        }
        duplex_voice::Logger::shutdown();
        return 1;
    }

    duplex_voice::Logger::info("Conversation started. Press Ctrl+C to hang up.");

    duplex_voice::SessionEvent event;
    while (!session_over) {
        if (duplex_voice::g_stop_requested) {
            std::cout << std::endl;
            duplex_voice::Logger::info("Shutting down...");
            session.disconnect();
            duplex_voice::g_stop_requested = false;
        }
        if (session.poll_event(event, std::chrono::milliseconds(100))) {
            duplex_voice::dispatch_event(event, callbacks);
        }
    }

    int result = session.state() == duplex_voice::SessionState::Error ? 1 : 0;
    session.disconnect();

    duplex_voice::Logger::shutdown();
    return result;
}
