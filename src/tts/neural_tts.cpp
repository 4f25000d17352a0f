#include "tts/neural_tts.h"
#include "audio_codec.h"
#include "http_client.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace holo_oracle {
namespace tts {

class NeuralTTS::Impl {
public:
    Impl(const NeuralTTSConfig& config, int output_sample_rate)
        : config_(config)
        , output_sample_rate_(output_sample_rate)
        , api_key_(read_api_key(config.api_key_env))
    {
        if (!config_.enabled) {
            LOG_TTS("Neural TTS disabled in config");
        } else if (api_key_.empty()) {
            LOG_WARN("[TTS] Neural TTS enabled but " + config_.api_key_env +
                     " is not set; engine unavailable");
        } else {
            available_ = true;
            LOG_TTS("Neural TTS ready: model=" + config_.model + " voice=" + config_.voice);
        }
    }

    bool available() const { return available_; }

    SynthResult synthesize(const std::string& text, const VoiceSettings& settings) {
        if (!available_) {
            return SynthResult::failure("neural", "Neural TTS not available");
        }

        auto start_time = Clock::now();

        json request;
        request["model"] = config_.model;
        request["modalities"] = json::array({"text", "audio"});
        request["audio"] = {{"voice", config_.voice}, {"format", "pcm16"}};
        request["messages"] = json::array({
            {{"role", "system"}, {"content", config_.instructions}},
            {{"role", "user"}, {"content", text}}
        });

        std::string body;
        try {
            body = request.dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const json::exception& e) {
            return SynthResult::failure("neural", "Cannot encode request: " + std::string(e.what()));
        }

        auto response = http::post_json(config_.endpoint, body, api_key_, config_.timeout_ms);
        if (response.failed()) {
            LOG_TTS("Neural request failed: " + response.error);
            return SynthResult::failure("neural", response.error);
        }

        std::string audio_b64;
        try {
            json body = json::parse(response.value->body);
            const json& message = body.at("choices").at(0).at("message");
            if (!message.contains("audio") || !message["audio"].contains("data")) {
                return SynthResult::failure("neural", "Response contained no audio");
            }
            audio_b64 = message["audio"]["data"].get<std::string>();
        } catch (const json::exception& e) {
            return SynthResult::failure("neural", "Bad response JSON: " + std::string(e.what()));
        }

        auto bytes = codec::base64_decode(audio_b64);
        if (bytes.failed()) {
            return SynthResult::failure("neural", "Bad audio payload: " + bytes.error);
        }

        AudioBuffer native;
        int native_rate = config_.native_sample_rate;
        const auto& raw = *bytes.value;
        if (raw.size() >= 4 && std::string(raw.begin(), raw.begin() + 4) == "RIFF") {
            auto wav = codec::parse_wav(raw);
            if (wav.failed()) {
                return SynthResult::failure("neural", "Bad WAV payload: " + wav.error);
            }
            native = std::move(wav.value->samples);
            native_rate = wav.value->sample_rate;
        } else {
            native = codec::pcm16_from_bytes(raw);
        }

        SynthResult result;
        result.engine = "neural";
        result.sample_rate = output_sample_rate_;
        result.audio = codec::resample_linear(native, native_rate, output_sample_rate_);
        codec::apply_gain(result.audio, settings.volume);
        result.synthesis_ms = ms_since(start_time);

        if (result.audio.empty()) {
            result.error = "Neural engine returned empty audio";
            return result;
        }

        std::ostringstream oss;
        oss << "Neural synthesized " << result.audio.size() << " samples in "
            << result.synthesis_ms << "ms (native " << native_rate << " Hz)";
        LOG_TTS(oss.str());
        return result;
    }

private:
    NeuralTTSConfig config_;
    int output_sample_rate_;
    std::string api_key_;
    bool available_ = false;
};

NeuralTTS::NeuralTTS(const NeuralTTSConfig& config, int output_sample_rate)
    : pimpl_(std::make_unique<Impl>(config, output_sample_rate)) {}

NeuralTTS::~NeuralTTS() = default;

std::string NeuralTTS::name() const {
    return "neural";
}

bool NeuralTTS::is_available() const {
    return pimpl_->available();
}

SynthResult NeuralTTS::synthesize(const std::string& text, const VoiceSettings& settings) {
    return pimpl_->synthesize(text, settings);
}

} // namespace tts
} // namespace holo_oracle
