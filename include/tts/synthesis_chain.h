#pragma once

/**
 * @file synthesis_chain.h
 * @brief Ordered failover across synthesis engines
 *
 * Engines are tried in the order given. An exception, timeout or empty result
 * from one engine moves on to the next; the chain fails only when every
 * available engine has failed. Successful results are cached by normalized
 * text plus voice settings.
 */

#include "tts_interface.h"
#include "core/constants.h"
#include <memory>
#include <vector>

namespace holo_oracle {
namespace tts {

class SynthesisChain {
public:
    /**
     * @param engines Highest priority first
     * @param output_sample_rate Rate every engine is expected to return
     * @param cache_entries LRU capacity (0 disables caching)
     */
    SynthesisChain(std::vector<std::unique_ptr<ISynthesizer>> engines,
                   int output_sample_rate,
                   size_t cache_entries = constants::tts::CACHE_ENTRIES,
                   size_t max_cache_text_length = constants::tts::MAX_CACHE_TEXT_LENGTH);
    ~SynthesisChain();

    // Non-copyable
    SynthesisChain(const SynthesisChain&) = delete;
    SynthesisChain& operator=(const SynthesisChain&) = delete;

    /**
     * @brief Synthesize with failover
     * @return First successful engine result, or a result whose error lists
     *         every engine's failure
     */
    SynthResult synthesize(const std::string& text, const VoiceSettings& settings);

    /// Name and availability of each engine, in priority order
    std::vector<EngineInfo> engines() const;

    /// True when at least one engine reported itself available
    bool has_available_engine() const;

    int output_sample_rate() const;

    /**
     * @brief Load a pre-rendered WAV and resample it to the output rate
     */
    Result<AudioBuffer> load_prerendered(const std::string& path) const;

    size_t cache_size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tts
} // namespace holo_oracle
