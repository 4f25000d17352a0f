#pragma once

/**
 * @file session.h
 * @brief Per-client conversation orchestrator
 */

#include "config.h"
#include "core/types.h"
#include "state_machine.h"
#include "memory/conversation_history.h"
#include <functional>
#include <memory>
#include <string>

namespace holo_oracle {

class ITranscriber;
class IResponder;

namespace faq {
class FaqRouter;
}

namespace tts {
class SynthesisChain;
}

namespace vad {
class ISpeechDetector;
}

/**
 * @brief Process-wide collaborators shared by every session
 *
 * Constructed once at startup and outlive all sessions. faq may be null
 * when the router is disabled.
 */
struct SessionServices {
    const Config& config;
    const faq::FaqRouter* faq;
    ITranscriber& transcriber;
    IResponder& responder;
    tts::SynthesisChain& synthesis;
};

/// Builds the speech detector owned by one session
using DetectorFactory = std::function<std::unique_ptr<vad::ISpeechDetector>()>;

/**
 * @brief One connected client
 *
 * handle_message() runs the whole turn synchronously (transcription, routing,
 * generation, synthesis) and emits replies through the sink in order. A
 * session is driven by exactly one thread; it holds no locks of its own.
 *
 * Inbound audio is re-framed to config.server.frame_ms before it reaches
 * the detector, and timestamps are derived from the sample count, so
 * endpointing does not depend on network timing.
 */
class Session {
public:
    Session(std::string id,
            const SessionServices& services,
            const DetectorFactory& make_detector,
            MessageSink sink);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Emit the welcome message (call once, first)
    void send_welcome();

    /// Handle one raw inbound message; protocol errors are logged and ignored
    void handle_message(const std::string& raw);

    const std::string& id() const;
    State state() const;
    const memory::ConversationHistory& history() const;
    const VoiceSettings& voice_settings() const;

    /// Samples currently held for the open utterance (including pre-speech pad)
    size_t buffered_samples() const;

    /**
     * @brief Mark the peer as gone (safe from any thread)
     *
     * An in-flight turn stops at its next stage boundary and releases its
     * audio; later messages are ignored. A transcription, generation or
     * synthesis call already running is not interrupted.
     */
    void cancel();
    bool cancelled() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace holo_oracle
