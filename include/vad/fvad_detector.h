#pragma once

/**
 * @file fvad_detector.h
 * @brief WebRTC VAD classifier (libfvad) as a speech detector
 */

#include "vad_interface.h"
#include "core/constants.h"
#include <memory>

namespace holo_oracle {
namespace vad {

/**
 * @brief Model-based detector on the WebRTC GMM classifier
 *
 * The frame is resampled to the nearest classifier rate (8/16/32/48 kHz) and
 * split into 30 ms sub-frames. The probability is the fraction of sub-frames
 * classified as speech; a frame shorter than one sub-frame scores 0.
 */
class FvadDetector : public ISpeechDetector {
public:
    /**
     * @param mode Aggressiveness 0 (least) to 3 (most)
     * @param sample_rate Rate of the frames passed to detect()
     * @throws std::runtime_error if the classifier cannot be created or configured
     */
    FvadDetector(int mode, int sample_rate);
    ~FvadDetector() override;

    FvadDetector(const FvadDetector&) = delete;
    FvadDetector& operator=(const FvadDetector&) = delete;

    float detect(const AudioFrame& frame) override;
    std::string name() const override { return "webrtc"; }
    bool model_based() const override { return true; }
    void reset() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vad
} // namespace holo_oracle
