#pragma once

/**
 * @file tts_interface.h
 * @brief Text-to-Speech interface
 *
 * Every synthesis backend (neural endpoint, local espeak-ng, test fakes)
 * implements ISynthesizer. The SynthesisChain tries them in priority order.
 */

#include "core/types.h"
#include <string>
#include <memory>
#include <vector>

namespace holo_oracle {
namespace tts {

/**
 * @brief TTS synthesis result
 */
struct SynthResult {
    AudioBuffer audio;
    int sample_rate = 0;
    std::string engine;       ///< Name of the engine that produced the audio
    int64_t synthesis_ms = 0;
    std::string error;

    bool ok() const { return error.empty() && !audio.empty(); }

    static SynthResult failure(std::string engine_name, std::string err) {
        SynthResult r;
        r.engine = std::move(engine_name);
        r.error = std::move(err);
        return r;
    }
};

/// Availability record reported in the welcome message
struct EngineInfo {
    std::string name;
    bool available = false;
};

/**
 * @brief Abstract synthesis backend
 *
 * Implementations must be safe to call from several session threads at once
 * and must not keep per-call settings in shared state.
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    /// Short engine identifier ("neural", "espeak-ng", ...)
    virtual std::string name() const = 0;

    /// Recorded once at construction; unavailable engines are skipped
    virtual bool is_available() const = 0;

    /**
     * @brief Synthesize text to audio at the engine's output rate
     * @param text Text to speak
     * @param settings Per-session voice parameters
     */
    virtual SynthResult synthesize(const std::string& text, const VoiceSettings& settings) = 0;
};

} // namespace tts
} // namespace holo_oracle
