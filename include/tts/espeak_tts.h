#pragma once

/**
 * @file espeak_tts.h
 * @brief Offline synthesis through the espeak-ng command-line tool
 *
 * Features:
 * - Executable resolved once at construction
 * - Voice enumerated and scored once at construction
 * - Each call runs espeak-ng in a child process with a hard timeout
 * - Output resampled to the configured rate
 */

#include "tts_interface.h"
#include "tts/voice_selection.h"
#include "config.h"
#include <memory>

namespace holo_oracle {
namespace tts {

class EspeakTTS : public ISynthesizer {
public:
    EspeakTTS(const OfflineTTSConfig& config, int output_sample_rate);
    ~EspeakTTS() override;

    // Non-copyable
    EspeakTTS(const EspeakTTS&) = delete;
    EspeakTTS& operator=(const EspeakTTS&) = delete;

    std::string name() const override;
    bool is_available() const override;
    SynthResult synthesize(const std::string& text, const VoiceSettings& settings) override;

    /// Voice passed with -v (empty = espeak-ng default)
    std::string selected_voice() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tts
} // namespace holo_oracle
