/**
 * @file espeak_tts.cpp
 * @brief espeak-ng offline synthesis
 */

#include "tts/espeak_tts.h"
#include "audio_codec.h"
#include "logger.h"
#include "path_utils.h"
#include "subprocess.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace holo_oracle {
namespace tts {

namespace {
constexpr int VOICE_LIST_TIMEOUT_MS = 5000;
constexpr int MIN_SPEED_WPM = 80;
constexpr int MAX_SPEED_WPM = 450;
constexpr int MAX_AMPLITUDE = 200;
}

class EspeakTTS::Impl {
public:
    Impl(const OfflineTTSConfig& config, int output_sample_rate)
        : config_(config)
        , output_sample_rate_(output_sample_rate)
    {
        if (!config_.enabled) {
            LOG_TTS("espeak-ng disabled in config");
            return;
        }

        executable_ = find_executable(config_.executable);
        if (executable_.empty()) {
            LOG_WARN("[TTS] espeak-ng not found: " + config_.executable);
            return;
        }
        available_ = true;

        if (!config_.voice.empty()) {
            voice_ = config_.voice;
            LOG_TTS("espeak-ng using configured voice: " + voice_);
        } else {
            choose_voice();
        }

        LOG_TTS("espeak-ng ready at " + executable_ +
                (voice_.empty() ? " (default voice)" : " voice=" + voice_));
    }

    bool available() const { return available_; }
    const std::string& voice() const { return voice_; }

    SynthResult synthesize(const std::string& text, const VoiceSettings& settings) {
        if (!available_) {
            return SynthResult::failure("espeak-ng", "espeak-ng not available");
        }

        auto start_time = Clock::now();

        std::string temp_wav = make_temp_path("holo_oracle_tts_", ".wav");
        if (temp_wav.empty()) {
            return SynthResult::failure("espeak-ng", "Could not create temporary file");
        }

        int speed = std::clamp(settings.speed, MIN_SPEED_WPM, MAX_SPEED_WPM);
        int amplitude = std::clamp(static_cast<int>(std::lround(settings.volume * 100.0f)), 0, MAX_AMPLITUDE);

        std::vector<std::string> argv = {executable_};
        if (!voice_.empty()) {
            argv.push_back("-v");
            argv.push_back(voice_);
        }
        argv.push_back("-s");
        argv.push_back(std::to_string(speed));
        argv.push_back("-a");
        argv.push_back(std::to_string(amplitude));
        argv.push_back("-w");
        argv.push_back(temp_wav);
        argv.push_back("--stdin");

        // Text goes through stdin so no shell quoting is involved
        ProcessResult proc = run_process(argv, text, config_.timeout_ms);
        if (!proc.ok()) {
            std::remove(temp_wav.c_str());
            std::string err = "espeak-ng failed: " + proc.describe();
            LOG_TTS(err);
            return SynthResult::failure("espeak-ng", err);
        }

        auto wav = codec::read_wav_file(temp_wav);
        std::remove(temp_wav.c_str());
        if (wav.failed()) {
            return SynthResult::failure("espeak-ng", "Failed to read synthesized audio: " + wav.error);
        }

        SynthResult result;
        result.engine = "espeak-ng";
        result.sample_rate = output_sample_rate_;
        result.audio = codec::resample_linear(wav.value->samples, wav.value->sample_rate, output_sample_rate_);
        result.synthesis_ms = ms_since(start_time);
        if (result.audio.empty()) {
            result.error = "espeak-ng produced no audio";
            return result;
        }

        std::ostringstream oss;
        oss << "espeak-ng synthesized " << result.audio.size() << " samples in "
            << result.synthesis_ms << "ms";
        LOG_TTS(oss.str());
        return result;
    }

private:
    void choose_voice() {
        ProcessResult proc = run_process({executable_, "--voices=" + config_.language}, "",
                                         VOICE_LIST_TIMEOUT_MS);
        if (!proc.ok()) {
            LOG_WARN("[TTS] Could not list espeak-ng voices (" + proc.describe() +
                     "), using default voice");
            return;
        }

        auto voices = parse_espeak_voices(proc.stdout_data);
        Platform platform = current_platform();
        auto best = select_voice(voices, platform);
        if (!best) {
            LOG_TTS("No espeak-ng voices for '" + config_.language + "', using default voice");
            return;
        }

        for (const auto& v : voices) {
            LOG_DEBUG("[TTS] Voice: " + v.name + " (score: " +
                      std::to_string(score_voice(v, platform)) + ")");
        }

        const VoiceInfo& chosen = voices[*best];
        voice_ = chosen.id;
        LOG_TTS("Selected voice: " + chosen.name + " (score: " +
                std::to_string(score_voice(chosen, platform)) + ")");
    }

    OfflineTTSConfig config_;
    int output_sample_rate_;
    std::string executable_;
    std::string voice_;
    bool available_ = false;
};

EspeakTTS::EspeakTTS(const OfflineTTSConfig& config, int output_sample_rate)
    : pimpl_(std::make_unique<Impl>(config, output_sample_rate)) {}

EspeakTTS::~EspeakTTS() = default;

std::string EspeakTTS::name() const {
    return "espeak-ng";
}

bool EspeakTTS::is_available() const {
    return pimpl_->available();
}

SynthResult EspeakTTS::synthesize(const std::string& text, const VoiceSettings& settings) {
    return pimpl_->synthesize(text, settings);
}

std::string EspeakTTS::selected_voice() const {
    return pimpl_->voice();
}

} // namespace tts
} // namespace holo_oracle
