#pragma once

/**
 * @file neural_tts.h
 * @brief Neural synthesis through an OpenAI-compatible audio chat endpoint
 *
 * The response text is sent as a chat request with audio output forced; the
 * returned base64 PCM16 is resampled from the engine's native rate to the
 * output rate. Available only when enabled and an API key is present.
 */

#include "tts_interface.h"
#include "config.h"
#include <memory>

namespace holo_oracle {
namespace tts {

class NeuralTTS : public ISynthesizer {
public:
    NeuralTTS(const NeuralTTSConfig& config, int output_sample_rate);
    ~NeuralTTS() override;

    // Non-copyable
    NeuralTTS(const NeuralTTS&) = delete;
    NeuralTTS& operator=(const NeuralTTS&) = delete;

    std::string name() const override;
    bool is_available() const override;
    SynthResult synthesize(const std::string& text, const VoiceSettings& settings) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tts
} // namespace holo_oracle
