#pragma once

/**
 * @file transport.h
 * @brief Bidirectional message channel used by the session
 */

#include "errors.h"
#include <functional>
#include <string>

namespace orbion {

/**
 * @brief Callbacks a transport invokes from its I/O thread
 */
struct TransportHandlers {
    std::function<void(const std::string&)> on_message;  ///< One complete inbound message
    std::function<void(const std::string&)> on_error;    ///< Transport failure after open
    std::function<void()> on_closed;                     ///< Remote closed the channel
};

/**
 * @brief Abstract message transport
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Open the channel (blocks until connected or failed)
     * @return ConnectionFailed on failure
     */
    virtual Result<void> open(const std::string& url, TransportHandlers handlers) = 0;

    /**
     * @brief Queue one outbound message; returns without waiting for the network
     *
     * Messages are written in the order send() was called.
     */
    virtual Result<void> send(const std::string& message) = 0;

    /**
     * @brief Close the channel and drop all handler registrations. Idempotent.
     *
     * Safe to call from inside a handler; in that case the I/O thread
     * finishes after the handler returns.
     */
    virtual Result<void> close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace orbion
