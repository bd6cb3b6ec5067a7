#pragma once

#include "transport.h"
#include <memory>

namespace orbion {

/**
 * @brief WebSocket transport on libcurl (CURLOPT_CONNECT_ONLY + curl_ws_send/curl_ws_recv)
 *
 * A single I/O thread owns the curl handle: it drains the outbound queue,
 * then polls the socket and reassembles inbound frames into messages.
 * Text and binary frames are both delivered to on_message.
 */
class WebSocketTransport : public ITransport {
public:
    /**
     * @param connect_timeout_ms Timeout for the TCP/TLS/upgrade handshake
     */
    explicit WebSocketTransport(int connect_timeout_ms = 10000);
    ~WebSocketTransport() override;

    // Non-copyable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    Result<void> open(const std::string& url, TransportHandlers handlers) override;
    Result<void> send(const std::string& message) override;
    Result<void> close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace orbion
