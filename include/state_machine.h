#pragma once

#include "vad_endpointing.h"
#include <memory>

namespace holo_oracle {

/**
 * @brief Conversation state of one session
 */
enum class State {
    Idle,        ///< Waiting for start_listening or typed text
    Listening,   ///< Buffering audio and running the detector
    Processing,  ///< Transcribing / routing / generating a reply
    Speaking     ///< Synthesizing and emitting the reply
};

inline const char* state_to_string(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Listening: return "listening";
        case State::Processing: return "processing";
        case State::Speaking: return "speaking";
    }
    return "unknown";
}

/**
 * @brief Session lifecycle state machine
 *
 * - Idle -> Listening (start_listening; also restarts an open Listening)
 * - Listening -> Processing (valid SpeechEnd / SpeechTimeout)
 * - Idle | Listening -> Processing (typed text, stop_listening flush)
 * - Processing -> Speaking (reply text chosen)
 * - any -> Idle (reply emitted, transcription failed, stop_listening)
 *
 * Methods return false and leave the state unchanged when the transition
 * is not allowed from the current state.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    State get_state() const;

    bool on_start_listening();

    /**
     * @brief Feed a detector boundary event
     * @return True if the event moved Listening -> Processing
     */
    bool on_segment_event(const SegmentEvent& event);

    bool on_begin_processing();

    bool on_begin_speaking();

    /// Back to Idle from any state
    void on_finished();

    /// Equivalent to on_finished(); kept separate for log clarity
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace holo_oracle
