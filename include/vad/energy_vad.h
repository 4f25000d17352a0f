#pragma once

/**
 * @file energy_vad.h
 * @brief Energy-based speech detector
 *
 * RMS energy gated by first-difference energy (a crude high-frequency
 * check that rejects hum), scaled into a pseudo-probability.
 */

#include "vad_interface.h"
#include "core/constants.h"

namespace holo_oracle {
namespace vad {

struct EnergyDetectorConfig {
    /// RMS (normalized samples) that must be exceeded
    float energy_threshold = constants::vad::ENERGY_THRESHOLD;

    /// First-difference RMS that must be exceeded
    float high_freq_threshold = constants::vad::ENERGY_HIGH_FREQ_THRESHOLD;

    /// probability = min(1, rms * scale)
    float scale = constants::vad::ENERGY_SCALE;

    /// Frames with this many samples or fewer score 0
    size_t min_frame_samples = 100;
};

class EnergyDetector : public ISpeechDetector {
public:
    explicit EnergyDetector(const EnergyDetectorConfig& config = {});

    float detect(const AudioFrame& frame) override;
    std::string name() const override { return "energy"; }
    bool model_based() const override { return false; }

    /// RMS of normalized samples (0 for an empty frame)
    static float rms(const AudioFrame& frame);

    /// RMS of the first difference of normalized samples
    static float diff_rms(const AudioFrame& frame);

private:
    EnergyDetectorConfig config_;
};

} // namespace vad
} // namespace holo_oracle
