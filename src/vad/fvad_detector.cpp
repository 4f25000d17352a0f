/**
 * @file fvad_detector.cpp
 * @brief libfvad-backed speech detector
 */

#include "vad/fvad_detector.h"
#include "vad/energy_vad.h"
#include "audio_codec.h"
#include "config.h"
#include "logger.h"
#include <fvad.h>
#include <string>
#include <stdexcept>

namespace holo_oracle {
namespace vad {

namespace {

/// Closest classifier-supported rate at or above the input rate
int classifier_rate(int sample_rate) {
    static const int kRates[] = {8000, 16000, 32000, 48000};
    for (int r : kRates) {
        if (sample_rate <= r) return r;
    }
    return 48000;
}

} // namespace

class FvadDetector::Impl {
public:
    Impl(int mode, int sample_rate)
        : mode_(mode)
        , input_rate_(sample_rate)
        , rate_(classifier_rate(sample_rate))
        , subframe_samples_(static_cast<size_t>(rate_ * constants::vad::CLASSIFIER_SUBFRAME_MS / 1000))
        , min_input_samples_(audio::ms_to_samples(constants::vad::CLASSIFIER_SUBFRAME_MS, sample_rate))
    {
        vad_ = fvad_new();
        if (!vad_) {
            throw std::runtime_error("fvad_new failed");
        }
        std::string err = configure();
        if (!err.empty()) {
            fvad_free(vad_);
            vad_ = nullptr;
            throw std::runtime_error(err);
        }
    }

    ~Impl() {
        if (vad_) {
            fvad_free(vad_);
        }
    }

    float detect(const AudioFrame& frame) {
        if (frame.size() < min_input_samples_) return 0.0f;

        AudioBuffer resampled = codec::resample_linear(frame, input_rate_, rate_);

        size_t voiced = 0;
        size_t scored = 0;
        for (size_t offset = 0; offset + subframe_samples_ <= resampled.size(); offset += subframe_samples_) {
            int r = fvad_process(vad_, resampled.data() + offset, subframe_samples_);
            if (r < 0) {
                LOG_VAD("fvad_process rejected sub-frame");
                continue;
            }
            ++scored;
            if (r == 1) ++voiced;
        }

        if (scored == 0) return 0.0f;
        return static_cast<float>(voiced) / static_cast<float>(scored);
    }

    void reset() {
        // fvad_reset() also restores the default mode and rate
        fvad_reset(vad_);
        std::string err = configure();
        if (!err.empty()) {
            Logger::warn("[VAD] Classifier reconfigure failed: " + err);
        }
    }

private:
    std::string configure() {
        if (fvad_set_sample_rate(vad_, rate_) < 0) {
            return "unsupported classifier rate " + std::to_string(rate_);
        }
        if (fvad_set_mode(vad_, mode_) < 0) {
            return "invalid classifier mode " + std::to_string(mode_);
        }
        return "";
    }

    Fvad* vad_ = nullptr;
    int mode_;
    int input_rate_;
    int rate_;
    size_t subframe_samples_;
    size_t min_input_samples_;
};

FvadDetector::FvadDetector(int mode, int sample_rate)
    : impl_(std::make_unique<Impl>(mode, sample_rate)) {}

FvadDetector::~FvadDetector() = default;

float FvadDetector::detect(const AudioFrame& frame) {
    return impl_->detect(frame);
}

void FvadDetector::reset() {
    impl_->reset();
}

std::unique_ptr<ISpeechDetector> make_speech_detector(const VADConfig& config, int sample_rate) {
    if (config.use_model) {
        try {
            return std::make_unique<FvadDetector>(config.model_mode, sample_rate);
        } catch (const std::exception& e) {
            Logger::warn(std::string("[VAD] Classifier unavailable, using energy detector: ") + e.what());
        }
    }

    EnergyDetectorConfig energy;
    energy.energy_threshold = config.energy_threshold;
    energy.high_freq_threshold = config.energy_high_freq_threshold;
    return std::make_unique<EnergyDetector>(energy);
}

} // namespace vad
} // namespace holo_oracle
