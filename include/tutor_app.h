#pragma once

#include "config.h"
#include "session_client.h"
#include <memory>

namespace orbion {

/**
 * @brief Builds the live session settings from configuration
 */
SessionSettings make_session_settings(const Config& config);

/**
 * @brief Console tutor: runs one scenario session against the live model
 *
 * Owns the PortAudio devices, the WebSocket transport and the checkpoint
 * machine, and presents session events through the logger:
 * - Transcript turns as they complete
 * - Checkpoint progress with the hint for the current objective
 * - Orb state and tips, with the elapsed session time
 */
class TutorApp {
public:
    explicit TutorApp(const Config& config);
    ~TutorApp();

    // Non-copyable
    TutorApp(const TutorApp&) = delete;
    TutorApp& operator=(const TutorApp&) = delete;

    /**
     * @brief Run until shutdown(), a fatal error or all checkpoints complete
     * @return Exit code (0 for success, non-zero for error)
     */
    int run();

    /**
     * @brief Request shutdown (async-signal-safe)
     */
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace orbion
