#pragma once

/**
 * @file ws_server.h
 * @brief WebSocket front end: one Session and one worker thread per client
 */

#include "config.h"
#include "core/types.h"
#include "session.h"
#include <memory>

namespace holo_oracle {

/**
 * @brief libwebsockets server speaking the "oracle-voice" protocol
 *
 * The service thread (the one calling run()) owns all socket I/O. Each
 * connection gets a worker thread that drains its inbound queue in arrival
 * order through a Session; replies are queued and written by the service
 * thread when the socket becomes writeable. A disconnect closes the inbound
 * queue and cancels the session, so a turn in flight stops at its next
 * stage boundary and releases its audio buffers.
 */
class WebSocketServer {
public:
    WebSocketServer(const Config& config,
                    const SessionServices& services,
                    DetectorFactory make_detector);
    ~WebSocketServer();

    // Non-copyable
    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Create the listening context
    VoidResult start();

    /**
     * @brief Service connections until stop() is called
     * @return Exit code (0 for a clean stop)
     */
    int run();

    /// Request the service loop to exit (thread- and signal-safe)
    void stop();

    /// Connections currently open
    size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace holo_oracle
