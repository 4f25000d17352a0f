#include "stt_engine.h"
#include "audio_codec.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <mutex>
#include <sstream>

namespace holo_oracle {

class WhisperTranscriber::Impl {
public:
    Impl(const STTConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_ERROR("[STT] Failed to load whisper model: " + config_.model_path);
            return;
        }

        LOG_STT("Model loaded: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    std::optional<std::string> transcribe(const AudioBuffer& samples, int sample_rate) {
        if (!ctx_ || samples.empty()) {
            return std::nullopt;
        }

        auto start = Clock::now();

        AudioBuffer input = codec::resample_linear(samples, sample_rate, WHISPER_SAMPLE_RATE);
        std::vector<float> pcmf32 = codec::to_float(input);

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.threads;
        params.no_context = true;
        params.single_segment = true;

        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
            if (ret != 0) {
                LOG_ERROR("[STT] whisper_full failed: " + std::to_string(ret));
                return std::nullopt;
            }

            int n_segments = whisper_full_n_segments(ctx_);
            for (int i = 0; i < n_segments; i++) {
                text += whisper_full_get_segment_text(ctx_, i);
            }
        }

        utils::trim(text);

        std::ostringstream oss;
        oss << "Transcribed " << audio::samples_to_ms(samples.size(), sample_rate) << "ms of audio in "
            << ms_since(start) << "ms: \"" << text << "\"";
        LOG_STT(oss.str());

        if (utils::is_blank_transcript(text, config_.blank_sentinel)) {
            return std::nullopt;
        }
        return text;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    STTConfig config_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperTranscriber::WhisperTranscriber(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperTranscriber::~WhisperTranscriber() = default;

std::optional<std::string> WhisperTranscriber::transcribe(const AudioBuffer& samples, int sample_rate) {
    return pimpl_->transcribe(samples, sample_rate);
}

bool WhisperTranscriber::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace holo_oracle
