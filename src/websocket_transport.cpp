#include "websocket_transport.h"
#include "logger.h"
#include <curl/curl.h>
#include <poll.h>
#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <chrono>
#include <vector>

namespace orbion {

namespace {

// Socket poll interval; bounds the latency of queued outbound messages
constexpr int IO_POLL_MS = 10;

constexpr size_t RECV_CHUNK_BYTES = 64 * 1024;

} // anonymous namespace

class WebSocketTransport::Impl {
public:
    explicit Impl(int connect_timeout_ms)
        : connect_timeout_ms_(connect_timeout_ms), curl_(nullptr), running_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        close();
        if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
            io_thread_.join();
        }
        curl_global_cleanup();
    }

    Result<void> open(const std::string& url, TransportHandlers handlers) {
        if (running_) {
            return make_error(ErrorType::InvalidState, "transport already open");
        }
        if (io_thread_.joinable()) {
            io_thread_.join();
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_connection_error("Failed to initialize CURL");
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket upgrade, then hand over the socket
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));

        LOG_NET("Connecting to " + redact(url));
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::string reason = curl_easy_strerror(res);
            curl_easy_cleanup(curl);
            return make_connection_error("WebSocket connect failed: " + reason);
        }

        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handlers_ = std::move(handlers);
        }
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            outbound_.clear();
        }
        curl_ = curl;
        running_ = true;
        io_thread_ = std::thread(&Impl::io_loop, this);
        LOG_NET("WebSocket connected");
        return Result<void>();
    }

    Result<void> send(const std::string& message) {
        if (!running_) {
            return make_error(ErrorType::InvalidState, "transport not open");
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        outbound_.push_back(message);
        return Result<void>();
    }

    Result<void> close() {
        running_ = false;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handlers_ = TransportHandlers();
        }
        if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
            io_thread_.join();
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        outbound_.clear();
        return Result<void>();
    }

    bool is_open() const {
        return running_;
    }

private:
    enum class Exit {
        LocalClose,
        RemoteClose,
        Failure
    };

    static std::string redact(const std::string& url) {
        auto pos = url.find("key=");
        if (pos == std::string::npos) return url;
        auto end = url.find('&', pos);
        return url.substr(0, pos + 4) + "***" + (end == std::string::npos ? "" : url.substr(end));
    }

    void io_loop() {
        Exit exit_reason = Exit::LocalClose;
        std::string failure;
        std::string message;
        std::vector<char> buf(RECV_CHUNK_BYTES);

        while (running_) {
            // 1. Outbound, in send() order
            std::deque<std::string> pending;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                pending.swap(outbound_);
            }
            for (const auto& out : pending) {
                if (!running_) break;
                CURLcode rc = send_frame(out.data(), out.size(), CURLWS_TEXT);
                if (rc != CURLE_OK) {
                    exit_reason = Exit::Failure;
                    failure = std::string("send failed: ") + curl_easy_strerror(rc);
                    break;
                }
            }
            if (exit_reason != Exit::LocalClose) break;

            // 2. Wait for inbound data; curl may already hold buffered frames, so drain regardless
            wait_readable(IO_POLL_MS);

            // 3. Drain and reassemble inbound frames
            bool stop = false;
            while (running_ && !stop) {
                size_t received = 0;
                const struct curl_ws_frame* meta = nullptr;
                CURLcode rc = curl_ws_recv(curl_, buf.data(), buf.size(), &received, &meta);
                if (rc == CURLE_AGAIN) {
                    break;
                }
                if (rc == CURLE_GOT_NOTHING) {
                    exit_reason = Exit::RemoteClose;
                    stop = true;
                    break;
                }
                if (rc != CURLE_OK || !meta) {
                    exit_reason = Exit::Failure;
                    failure = std::string("receive failed: ") + curl_easy_strerror(rc);
                    stop = true;
                    break;
                }
                if (meta->flags & CURLWS_CLOSE) {
                    exit_reason = Exit::RemoteClose;
                    stop = true;
                    break;
                }
                if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                    continue;  // libcurl answers pings itself
                }
                message.append(buf.data(), received);
                if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                    deliver_message(message);
                    message.clear();
                }
            }
            if (stop) break;
        }

        if (exit_reason == Exit::LocalClose) {
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            if (rc != CURLE_OK) {
                Logger::debug(std::string("[Net] close frame not sent: ") + curl_easy_strerror(rc));
            }
        }
        curl_easy_cleanup(curl_);
        curl_ = nullptr;

        bool was_running = running_.exchange(false);
        if (!was_running) {
            LOG_NET("WebSocket closed locally");
            return;
        }

        TransportHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handlers = handlers_;
        }
        if (exit_reason == Exit::RemoteClose) {
            LOG_NET("WebSocket closed by remote");
            if (handlers.on_closed) handlers.on_closed();
        } else {
            Logger::error("[Net] " + failure);
            if (handlers.on_error) handlers.on_error(failure);
        }
    }

    CURLcode send_frame(const char* data, size_t len, unsigned int flags) {
        size_t offset = 0;
        do {
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl_, data + offset, len - offset, &sent, 0, flags);
            if (rc == CURLE_AGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (rc != CURLE_OK) {
                return rc;
            }
            offset += sent;
        } while (offset < len && running_);
        return CURLE_OK;
    }

    void wait_readable(int timeout_ms) {
        curl_socket_t sock = CURL_SOCKET_BAD;
        if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
            // curl_ws_recv reports the failure
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return;
        }
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) < 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        }
    }

    void deliver_message(const std::string& message) {
        std::function<void(const std::string&)> on_message;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            on_message = handlers_.on_message;
        }
        if (on_message) {
            on_message(message);
        }
    }

    int connect_timeout_ms_;
    CURL* curl_;
    std::atomic<bool> running_;
    std::thread io_thread_;

    std::mutex queue_mutex_;
    std::deque<std::string> outbound_;

    std::mutex handler_mutex_;
    TransportHandlers handlers_;
};

WebSocketTransport::WebSocketTransport(int connect_timeout_ms)
    : pimpl_(std::make_unique<Impl>(connect_timeout_ms)) {}
WebSocketTransport::~WebSocketTransport() = default;

Result<void> WebSocketTransport::open(const std::string& url, TransportHandlers handlers) {
    return pimpl_->open(url, std::move(handlers));
}

Result<void> WebSocketTransport::send(const std::string& message) {
    return pimpl_->send(message);
}

Result<void> WebSocketTransport::close() {
    return pimpl_->close();
}

bool WebSocketTransport::is_open() const {
    return pimpl_->is_open();
}

} // namespace orbion
