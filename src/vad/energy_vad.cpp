/**
 * @file energy_vad.cpp
 * @brief Energy-based speech detector
 */

#include "vad/energy_vad.h"
#include <algorithm>
#include <cmath>

namespace holo_oracle {
namespace vad {

EnergyDetector::EnergyDetector(const EnergyDetectorConfig& config)
    : config_(config) {}

float EnergyDetector::rms(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;

    double sum_squares = 0.0;
    for (Sample s : frame) {
        double v = static_cast<double>(s) / 32768.0;
        sum_squares += v * v;
    }
    return static_cast<float>(std::sqrt(sum_squares / static_cast<double>(frame.size())));
}

float EnergyDetector::diff_rms(const AudioFrame& frame) {
    if (frame.size() < 2) return 0.0f;

    double sum_squares = 0.0;
    for (size_t i = 1; i < frame.size(); ++i) {
        double d = (static_cast<double>(frame[i]) - static_cast<double>(frame[i - 1])) / 32768.0;
        sum_squares += d * d;
    }
    return static_cast<float>(std::sqrt(sum_squares / static_cast<double>(frame.size() - 1)));
}

float EnergyDetector::detect(const AudioFrame& frame) {
    if (frame.size() <= config_.min_frame_samples) return 0.0f;

    float energy = rms(frame);
    if (energy <= config_.energy_threshold) return 0.0f;

    if (diff_rms(frame) <= config_.high_freq_threshold) return 0.0f;

    return std::min(1.0f, energy * config_.scale);
}

} // namespace vad
} // namespace holo_oracle
