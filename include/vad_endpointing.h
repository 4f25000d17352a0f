#pragma once

/**
 * @file vad_endpointing.h
 * @brief Utterance boundary state machine driven by speech probabilities
 */

#include "core/types.h"
#include "config.h"
#include <memory>
#include <vector>

namespace holo_oracle {

namespace vad {
class ISpeechDetector;
}

enum class VADEvent {
    None,           ///< Silence while not speaking
    SpeechStart,    ///< Probability crossed the threshold from silence
    SpeechContinue, ///< Still inside an utterance (speech frame or dip inside hangover)
    SpeechEnd,      ///< Continuous silence reached the hangover duration
    SpeechTimeout   ///< Utterance exceeded the maximum duration; always valid
};

enum class VADState {
    Silent,
    Speaking
};

inline const char* vad_event_to_string(VADEvent event) {
    switch (event) {
        case VADEvent::None: return "silence";
        case VADEvent::SpeechStart: return "speech_start";
        case VADEvent::SpeechContinue: return "speech_continue";
        case VADEvent::SpeechEnd: return "speech_end";
        case VADEvent::SpeechTimeout: return "speech_timeout";
    }
    return "unknown";
}

/**
 * @brief Result of one update() call
 *
 * duration_ms and valid_speech are meaningful for SpeechEnd and
 * SpeechTimeout only.
 */
struct SegmentEvent {
    VADEvent type = VADEvent::None;
    int64_t timestamp_ms = 0;
    float probability = 0.0f;
    int64_t duration_ms = 0;
    bool valid_speech = false;

    bool is_boundary() const {
        return type == VADEvent::SpeechEnd || type == VADEvent::SpeechTimeout;
    }
};

/**
 * @brief Two-state hysteresis over a probability stream
 *
 * Silent -> Speaking when probability > threshold. Speaking -> Silent only
 * once the time since the last speech frame reaches hangover_ms; shorter dips
 * report SpeechContinue. SpeechEnd duration runs from the start to the last
 * speech frame and is valid when >= min_speech_ms. An utterance longer than
 * max_speech_ms ends with SpeechTimeout, marked valid.
 *
 * Timestamps must be non-decreasing. Not thread-safe.
 */
class VADEndpointing {
public:
    explicit VADEndpointing(const VADConfig& config);
    ~VADEndpointing();

    VADEndpointing(const VADEndpointing&) = delete;
    VADEndpointing& operator=(const VADEndpointing&) = delete;

    SegmentEvent update(float probability, int64_t timestamp_ms);

    /// Return to Silent and forget the open utterance
    void reset();

    VADState state() const;
    bool is_speaking() const;

    /// Start of the open utterance (0 when silent)
    int64_t speech_start_ms() const;

    /// Timestamp of the most recent speech frame (0 when silent)
    int64_t last_speech_ms() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/// Speech span within a buffer, in milliseconds from its start
struct SpeechSpan {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
};

/**
 * @brief Offline segmentation of a complete buffer
 *
 * Scores consecutive frame_ms windows with the detector and returns spans
 * whose probability exceeds config.threshold for at least min_speech_ms.
 * A span still open at the end of the buffer is closed there.
 */
std::vector<SpeechSpan> segment_speech(const AudioBuffer& audio, int sample_rate,
                                       vad::ISpeechDetector& detector,
                                       const VADConfig& config,
                                       int frame_ms = constants::audio::FRAME_MS);

} // namespace holo_oracle
