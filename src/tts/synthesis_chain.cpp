#include "tts/synthesis_chain.h"
#include "tts/lru_cache.h"
#include "audio_codec.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <sstream>

namespace holo_oracle {
namespace tts {

namespace {

std::string cache_key(const std::string& text, const VoiceSettings& settings) {
    std::ostringstream oss;
    oss << utils::collapse_whitespace_lower(text)
        << '|' << settings.speed
        << '|' << std::lround(settings.volume * 100.0f);
    return oss.str();
}

} // namespace

class SynthesisChain::Impl {
public:
    Impl(std::vector<std::unique_ptr<ISynthesizer>> engines,
         int output_sample_rate,
         size_t cache_entries,
         size_t max_cache_text_length)
        : engines_(std::move(engines))
        , output_sample_rate_(output_sample_rate)
        , max_cache_text_length_(max_cache_text_length)
        , cache_(cache_entries)
    {
        std::ostringstream oss;
        oss << "Synthesis chain:";
        for (const auto& engine : engines_) {
            oss << " " << engine->name() << (engine->is_available() ? "[ok]" : "[unavailable]");
        }
        oss << ", cache_max=" << cache_entries;
        LOG_TTS(oss.str());
    }

    SynthResult synthesize(const std::string& text, const VoiceSettings& settings) {
        if (utils::is_empty_or_whitespace(text)) {
            return SynthResult::failure("", "Empty text");
        }

        std::string key = cache_key(text, settings);
        if (auto cached = cache_.get(key)) {
            LOG_TTS("Cache hit (" + cached->engine + ")");
            SynthResult hit = *cached;
            hit.synthesis_ms = 0;
            return hit;
        }

        std::string errors;
        for (const auto& engine : engines_) {
            if (!engine->is_available()) {
                continue;
            }

            SynthResult result;
            try {
                result = engine->synthesize(text, settings);
            } catch (const std::exception& e) {
                result = SynthResult::failure(engine->name(), std::string("exception: ") + e.what());
            }

            if (result.ok()) {
                result.engine = engine->name();
                if (result.sample_rate <= 0) {
                    result.sample_rate = output_sample_rate_;
                }
                if (text.size() <= max_cache_text_length_) {
                    cache_.put(key, result);
                }
                return result;
            }

            std::string err = result.error.empty() ? "empty audio" : result.error;
            LOG_WARN("[TTS] Engine " + engine->name() + " failed: " + err + ", trying next");
            if (!errors.empty()) errors += "; ";
            errors += engine->name() + ": " + err;
        }

        if (errors.empty()) {
            errors = "no synthesis engine available";
        }
        LOG_ERROR("[TTS] All synthesis engines failed: " + errors);
        return SynthResult::failure("", "All synthesis engines failed: " + errors);
    }

    std::vector<EngineInfo> engines() const {
        std::vector<EngineInfo> info;
        for (const auto& engine : engines_) {
            info.push_back({engine->name(), engine->is_available()});
        }
        return info;
    }

    bool has_available_engine() const {
        for (const auto& engine : engines_) {
            if (engine->is_available()) return true;
        }
        return false;
    }

    int output_sample_rate() const { return output_sample_rate_; }

    Result<AudioBuffer> load_prerendered(const std::string& path) const {
        auto wav = codec::read_wav_file(path);
        if (wav.failed()) {
            return Result<AudioBuffer>::failure(wav.error);
        }
        return Result<AudioBuffer>::success(
            codec::resample_linear(wav.value->samples, wav.value->sample_rate, output_sample_rate_));
    }

    size_t cache_size() const { return cache_.size(); }

private:
    std::vector<std::unique_ptr<ISynthesizer>> engines_;
    int output_sample_rate_;
    size_t max_cache_text_length_;
    LRUCache<std::string, SynthResult> cache_;
};

SynthesisChain::SynthesisChain(std::vector<std::unique_ptr<ISynthesizer>> engines,
                               int output_sample_rate,
                               size_t cache_entries,
                               size_t max_cache_text_length)
    : pimpl_(std::make_unique<Impl>(std::move(engines), output_sample_rate,
                                    cache_entries, max_cache_text_length)) {}

SynthesisChain::~SynthesisChain() = default;

SynthResult SynthesisChain::synthesize(const std::string& text, const VoiceSettings& settings) {
    return pimpl_->synthesize(text, settings);
}

std::vector<EngineInfo> SynthesisChain::engines() const {
    return pimpl_->engines();
}

bool SynthesisChain::has_available_engine() const {
    return pimpl_->has_available_engine();
}

int SynthesisChain::output_sample_rate() const {
    return pimpl_->output_sample_rate();
}

Result<AudioBuffer> SynthesisChain::load_prerendered(const std::string& path) const {
    return pimpl_->load_prerendered(path);
}

size_t SynthesisChain::cache_size() const {
    return pimpl_->cache_size();
}

} // namespace tts
} // namespace holo_oracle
