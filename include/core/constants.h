#pragma once

/**
 * @file constants.h
 * @brief Default tuning parameters
 *
 * Compiled defaults for every configurable value. The config file overrides
 * them per deployment.
 */

#include <cstddef>

namespace holo_oracle {
namespace constants {

// =============================================================================
// Audio
// =============================================================================

namespace audio {
    /// Inbound microphone rate negotiated at connection start (Hz)
    constexpr int INPUT_SAMPLE_RATE = 16000;

    /// Rate of synthesized audio sent back to the client (Hz)
    constexpr int OUTPUT_SAMPLE_RATE = 22050;

    /// Detector frame duration (ms)
    constexpr int FRAME_MS = 100;
}

// =============================================================================
// VAD (Voice Activity Detection)
// =============================================================================

namespace vad {
    /// Speech probability threshold
    constexpr float THRESHOLD = 0.5f;

    /// Minimum utterance duration to be valid speech (ms)
    constexpr int MIN_SPEECH_MS = 500;

    /// Continuous silence that ends an utterance (ms)
    constexpr int HANGOVER_MS = 1000;

    /// Hard cap on a single utterance before it is force-flushed (ms)
    constexpr int MAX_SPEECH_MS = 30000;

    /// Energy detector: RMS above this counts as voiced energy
    constexpr float ENERGY_THRESHOLD = 0.01f;

    /// Energy detector: first-difference RMS above this counts as speech-like
    constexpr float ENERGY_HIGH_FREQ_THRESHOLD = 0.001f;

    /// Energy detector: RMS to pseudo-probability scale
    constexpr float ENERGY_SCALE = 10.0f;

    /// WebRTC classifier aggressiveness (0-3)
    constexpr int CLASSIFIER_MODE = 2;

    /// WebRTC classifier sub-frame length (ms)
    constexpr int CLASSIFIER_SUBFRAME_MS = 30;
}

// =============================================================================
// FAQ Router
// =============================================================================

namespace faq {
    constexpr float SIMILARITY_THRESHOLD = 0.7f;
    constexpr size_t MIN_SENTENCE_CHARS = 20;
    constexpr size_t MAX_SENTENCE_CHARS = 200;
    constexpr size_t MAX_ENTRIES = 50;
    constexpr size_t MAX_MATCHES_PER_PHRASE = 3;
    constexpr size_t MAX_EXPLANATION_ENTRIES = 10;
    constexpr size_t MAX_PHILOSOPHICAL_ENTRIES = 15;
    constexpr size_t MAX_CHARACTER_ENTRIES = 10;
    constexpr size_t MAX_TRIGGERS_PER_ENTRY = 5;
    constexpr int MIN_PHILOSOPHICAL_KEYWORDS = 2;

    constexpr float FAMOUS_QUOTE_BOOST = 0.2f;
    constexpr float PHILOSOPHICAL_BOOST = 0.15f;
    constexpr float EXPLANATION_BOOST = 0.1f;
    constexpr float CHARACTER_BOOST = 0.1f;
}

// =============================================================================
// TTS
// =============================================================================

namespace tts {
    /// Offline engine hard timeout (ms)
    constexpr int OFFLINE_TIMEOUT_MS = 30000;

    /// Neural engine request timeout (ms)
    constexpr int NEURAL_TIMEOUT_MS = 60000;

    /// Native rate of the neural engine's PCM16 output (Hz)
    constexpr int NEURAL_NATIVE_RATE = 24000;

    /// Synthesis cache capacity
    constexpr size_t CACHE_ENTRIES = 64;

    /// Only texts up to this length are cached
    constexpr size_t MAX_CACHE_TEXT_LENGTH = 400;
}

// =============================================================================
// Session
// =============================================================================

namespace session {
    /// Conversation history cap (messages, oldest discarded first)
    constexpr size_t MAX_HISTORY = 20;

    /// Audio kept ahead of a detected speech start (ms)
    constexpr int PRE_SPEECH_MS = 300;

    /// stop_listening flushes an in-progress utterance at least this long (ms)
    constexpr int STOP_FLUSH_MIN_MS = 1000;
}

// =============================================================================
// LLM
// =============================================================================

namespace llm {
    /// Turns of history sent with each request
    constexpr int CONTEXT_MAX_TURNS = 6;
    constexpr int TIMEOUT_MS = 30000;
    constexpr int MAX_TOKENS = 500;
}

} // namespace constants
} // namespace holo_oracle
