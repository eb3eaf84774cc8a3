#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace duplex_voice {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

thread_local std::string t_thread_name;

// Serializes the undecorated output used before initialize()
std::mutex g_console_mutex;

void to_console(LogLevel level, const std::string& line) {
    std::ostream& os = level >= LogLevel::ERROR ? std::cerr : std::cout;
    os << line << '\n';
    os.flush();
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm local_tm{};
    localtime_r(&secs, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

} // anonymous namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (output_file.empty()) {
            return;
        }
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: cannot open log file " << output_file
                      << ", logging to console only" << std::endl;
        }
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void emit(LogLevel level, const std::string& message) {
        std::string line = std::string("[") + level_tag(level) + "] " + timestamp_now() + " ";
        if (!t_thread_name.empty()) {
            line += "<" + t_thread_name + "> ";
        }
        line += message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }
        to_console(level, line);
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::write(LogLevel level, const std::string& message) {
    if (impl_) {
        if (impl_->enabled(level)) {
            impl_->emit(level, message);
        }
        return;
    }
    if (level >= LogLevel::INFO) {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        to_console(level, message);
    }
}

void Logger::debug(const std::string& message) { write(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { write(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { write(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { write(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->level() : LogLevel::INFO;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace duplex_voice
