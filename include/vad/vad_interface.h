#pragma once

/**
 * @file vad_interface.h
 * @brief Speech detector interface
 *
 * A detector scores one fixed-duration frame with a speech probability.
 * Implementations are interchangeable (WebRTC classifier, energy-based).
 */

#include "core/types.h"
#include <memory>
#include <string>

namespace holo_oracle {

struct VADConfig;

namespace vad {

/**
 * @brief Abstract speech detector
 *
 * Not thread-safe; each session owns its own instance.
 */
class ISpeechDetector {
public:
    virtual ~ISpeechDetector() = default;

    /**
     * @brief Score a single audio frame
     * @param frame PCM16 samples at the detector's sample rate
     * @return Speech probability in [0, 1]; 0 for frames too short to score
     */
    virtual float detect(const AudioFrame& frame) = 0;

    /// Short identifier for logging ("webrtc", "energy")
    virtual std::string name() const = 0;

    /// True for trained classifiers, false for the energy heuristic
    virtual bool model_based() const = 0;

    /// Clear any state carried between frames
    virtual void reset() {}
};

/**
 * @brief Build the detector for one session
 *
 * Tries the WebRTC classifier when config.use_model is set. On any
 * initialization failure the energy detector is returned instead, so the
 * result is never null.
 */
std::unique_ptr<ISpeechDetector> make_speech_detector(const VADConfig& config, int sample_rate);

} // namespace vad
} // namespace holo_oracle
