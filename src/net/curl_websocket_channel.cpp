#include "net/curl_websocket_channel.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <poll.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>

namespace duplex_voice {
namespace net {

namespace {

constexpr size_t RECV_CHUNK_BYTES = 16 * 1024;
constexpr int POLL_SLICE_MS = 50;

// The frame pointer is `const` from libcurl 8 on; deduce whichever this build has
template<typename FramePtr>
CURLcode recv_frame(CURLcode (*fn)(CURL*, void*, size_t, size_t*, FramePtr*),
                    CURL* curl, void* buffer, size_t length, size_t* received,
                    const curl_ws_frame** meta) {
    FramePtr frame = nullptr;
    CURLcode rc = fn(curl, buffer, length, received, &frame);
    *meta = frame;
    return rc;
}

/// Wait until the socket is readable (or writable), at most `timeout_ms`
void wait_socket(curl_socket_t sock, bool for_write, int timeout_ms) {
    if (sock == CURL_SOCKET_BAD) {
        return;
    }
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = for_write ? POLLOUT : POLLIN;
    pfd.revents = 0;
    poll(&pfd, 1, timeout_ms);
}

std::string redact_url(const std::string& url) {
    auto pos = url.find("key=");
    if (pos == std::string::npos) return url;
    auto end = url.find('&', pos);
    return url.substr(0, pos + 4) + "***" + (end == std::string::npos ? "" : url.substr(end));
}

} // anonymous namespace

class CurlWebSocketChannel::Impl {
public:
    Impl() : curl_(nullptr), headers_(nullptr), connecting_(false), cancel_(false),
             close_code_(0), open_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        close();
        curl_global_cleanup();
    }

    Result<void> open(const std::string& url, const std::vector<std::string>& headers, int timeout_ms) {
        CURL* handle = nullptr;
        struct curl_slist* header_list = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (curl_ || connecting_) {
                return make_error(ErrorType::InvalidState, "channel already open");
            }
            if (!utils::starts_with_nocase(url, "ws://") && !utils::starts_with_nocase(url, "wss://")) {
                return make_network_error("not a WebSocket URL: " + redact_url(url));
            }
            handle = curl_easy_init();
            if (!handle) {
                return make_network_error("Failed to initialize CURL");
            }
            connecting_ = true;
            cancel_ = false;
        }

        for (const auto& header : headers) {
            header_list = curl_slist_append(header_list, header.c_str());
        }
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_CONNECT_ONLY, 2L);  // 2 = WebSocket upgrade, then hand over
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &Impl::abort_if_cancelled);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, this);
        if (header_list) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
        }

        // Unlocked so close() can cancel a slow connect
        LOG_TRANSPORT("Connecting to " + redact_url(url));
        CURLcode res = curl_easy_perform(handle);
        long http_code = 0;
        if (res != CURLE_OK) {
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &http_code);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        connecting_ = false;
        if (res != CURLE_OK || cancel_) {
            curl_easy_cleanup(handle);
            curl_slist_free_all(header_list);
            if (cancel_) {
                return make_network_error("connect cancelled by close()");
            }
            std::ostringstream oss;
            oss << curl_easy_strerror(res);
            if (http_code != 0) {
                oss << " (HTTP " << http_code << ")";
            }
            if (http_code == 401 || http_code == 403) {
                return make_auth_error("remote rejected credentials: " + oss.str());
            }
            return make_network_error("cannot connect: " + oss.str());
        }

        curl_ = handle;
        headers_ = header_list;
        close_code_ = 0;
        partial_.clear();
        open_ = true;
        LOG_TRANSPORT("WebSocket established");
        return {};
    }

    Result<void> send_text(const std::string& message) {
        size_t offset = 0;
        while (true) {
            curl_socket_t sock = CURL_SOCKET_BAD;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!curl_) {
                    return make_network_error("channel closed");
                }
                size_t sent = 0;
                CURLcode res = curl_ws_send(curl_, message.data() + offset, message.size() - offset,
                                            &sent, 0, CURLWS_TEXT);
                offset += sent;
                if (res == CURLE_OK && offset >= message.size()) {
                    return {};
                }
                if (res != CURLE_OK && res != CURLE_AGAIN) {
                    open_ = false;
                    return make_network_error(std::string("send failed: ") + curl_easy_strerror(res));
                }
                sock = active_socket_locked();
            }
            wait_socket(sock, true, POLL_SLICE_MS);
        }
    }

    Result<ReceiveStatus> receive(std::string& out, int timeout_ms) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        char buffer[RECV_CHUNK_BYTES];

        while (true) {
            curl_socket_t sock = CURL_SOCKET_BAD;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!curl_) {
                    return make_network_error("channel closed");
                }

                size_t received = 0;
                const curl_ws_frame* meta = nullptr;
                CURLcode res = recv_frame(&curl_ws_recv, curl_, buffer, sizeof(buffer), &received, &meta);

                if (res == CURLE_OK && meta) {
                    if (meta->flags & CURLWS_CLOSE) {
                        // Payload starts with a big-endian status code
                        if (received >= 2) {
                            close_code_ = (static_cast<unsigned char>(buffer[0]) << 8) |
                                          static_cast<unsigned char>(buffer[1]);
                        } else {
                            close_code_ = CLOSE_NORMAL;
                        }
                        open_ = false;
                        return ReceiveStatus::Closed;
                    }
                    if (meta->flags & (CURLWS_TEXT | CURLWS_BINARY)) {
                        partial_.append(buffer, received);
                        bool frame_done = meta->bytesleft == 0;
                        bool message_done = frame_done && !(meta->flags & CURLWS_CONT);
                        if (message_done) {
                            out.swap(partial_);
                            partial_.clear();
                            return ReceiveStatus::Message;
                        }
                        continue;
                    }
                    // Ping/pong: libcurl answers pings itself
                    continue;
                }
                if (res != CURLE_AGAIN) {
                    open_ = false;
                    return make_network_error(std::string("connection lost: ") + curl_easy_strerror(res));
                }
                sock = active_socket_locked();
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return ReceiveStatus::Timeout;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            wait_socket(sock, false, static_cast<int>(std::min<long long>(left, POLL_SLICE_MS)));
        }
    }

    int close_code() const {
        return close_code_;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_) {
            cancel_ = true;  // open() sees it on its next progress tick
        }
        if (!curl_) {
            return;
        }
        if (open_) {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            if (res != CURLE_OK) {
                // The remote may already be gone
                Logger::debug(std::string("Close frame not sent: ") + curl_easy_strerror(res));
            }
        }
        release_locked();
        LOG_TRANSPORT("WebSocket closed");
    }

    bool is_open() const {
        return open_;
    }

private:
    static int abort_if_cancelled(void* user_data, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        return static_cast<Impl*>(user_data)->cancel_ ? 1 : 0;
    }

    curl_socket_t active_socket_locked() {
        curl_socket_t sock = CURL_SOCKET_BAD;
        curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock);
        return sock;
    }

    void release_locked() {
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        if (headers_) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        open_ = false;
    }

    mutable std::mutex mutex_;
    CURL* curl_;
    struct curl_slist* headers_;
    std::string partial_;
    bool connecting_;
    std::atomic<bool> cancel_;
    std::atomic<int> close_code_;
    std::atomic<bool> open_;
};

CurlWebSocketChannel::CurlWebSocketChannel() : pimpl_(std::make_unique<Impl>()) {}
CurlWebSocketChannel::~CurlWebSocketChannel() = default;

Result<void> CurlWebSocketChannel::open(const std::string& url,
                                        const std::vector<std::string>& headers,
                                        int timeout_ms) {
    return pimpl_->open(url, headers, timeout_ms);
}

Result<void> CurlWebSocketChannel::send_text(const std::string& message) {
    return pimpl_->send_text(message);
}

Result<ReceiveStatus> CurlWebSocketChannel::receive(std::string& out, int timeout_ms) {
    return pimpl_->receive(out, timeout_ms);
}

int CurlWebSocketChannel::close_code() const {
    return pimpl_->close_code();
}

void CurlWebSocketChannel::close() {
    pimpl_->close();
}

bool CurlWebSocketChannel::is_open() const {
    return pimpl_->is_open();
}

} // namespace net
} // namespace duplex_voice
