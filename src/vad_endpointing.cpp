#include "vad_endpointing.h"
#include "vad/vad_interface.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace holo_oracle {

class VADEndpointing::Impl {
public:
    explicit Impl(const VADConfig& config)
        : config_(config) {}

    SegmentEvent update(float probability, int64_t timestamp_ms) {
        SegmentEvent event;
        event.timestamp_ms = timestamp_ms;
        event.probability = probability;

        bool is_speech = probability > config_.threshold;

        if (state_ == VADState::Silent) {
            if (!is_speech) {
                return event;
            }
            state_ = VADState::Speaking;
            speech_start_ms_ = timestamp_ms;
            last_speech_ms_ = timestamp_ms;
            event.type = VADEvent::SpeechStart;

            std::ostringstream oss;
            oss << "SpeechStart t=" << timestamp_ms << "ms p=" << probability;
            LOG_VAD(oss.str());
            return event;
        }

        if (is_speech) {
            last_speech_ms_ = timestamp_ms;
        } else if (timestamp_ms - last_speech_ms_ >= config_.hangover_ms) {
            event.type = VADEvent::SpeechEnd;
            event.duration_ms = last_speech_ms_ - speech_start_ms_;
            event.valid_speech = event.duration_ms >= config_.min_speech_ms;

            std::ostringstream oss;
            oss << "SpeechEnd t=" << timestamp_ms << "ms duration=" << event.duration_ms
                << "ms valid=" << (event.valid_speech ? "yes" : "no");
            LOG_VAD(oss.str());

            close_utterance();
            return event;
        }

        int64_t open_ms = timestamp_ms - speech_start_ms_;
        if (open_ms > config_.max_speech_ms) {
            event.type = VADEvent::SpeechTimeout;
            event.duration_ms = open_ms;
            event.valid_speech = true;

            std::ostringstream oss;
            oss << "SpeechTimeout t=" << timestamp_ms << "ms duration=" << open_ms << "ms";
            LOG_VAD(oss.str());

            close_utterance();
            return event;
        }

        event.type = VADEvent::SpeechContinue;
        return event;
    }

    void reset() {
        close_utterance();
    }

    VADState state() const { return state_; }
    int64_t speech_start_ms() const { return speech_start_ms_; }
    int64_t last_speech_ms() const { return last_speech_ms_; }

private:
    void close_utterance() {
        state_ = VADState::Silent;
        speech_start_ms_ = 0;
        last_speech_ms_ = 0;
    }

    VADConfig config_;
    VADState state_ = VADState::Silent;
    int64_t speech_start_ms_ = 0;
    int64_t last_speech_ms_ = 0;
};

VADEndpointing::VADEndpointing(const VADConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

VADEndpointing::~VADEndpointing() = default;

SegmentEvent VADEndpointing::update(float probability, int64_t timestamp_ms) {
    return pimpl_->update(probability, timestamp_ms);
}

void VADEndpointing::reset() {
    pimpl_->reset();
}

VADState VADEndpointing::state() const {
    return pimpl_->state();
}

bool VADEndpointing::is_speaking() const {
    return pimpl_->state() == VADState::Speaking;
}

int64_t VADEndpointing::speech_start_ms() const {
    return pimpl_->speech_start_ms();
}

int64_t VADEndpointing::last_speech_ms() const {
    return pimpl_->last_speech_ms();
}

std::vector<SpeechSpan> segment_speech(const AudioBuffer& audio, int sample_rate,
                                       vad::ISpeechDetector& detector,
                                       const VADConfig& config,
                                       int frame_ms) {
    std::vector<SpeechSpan> spans;
    if (audio.empty() || sample_rate <= 0 || frame_ms <= 0) return spans;

    const size_t window = std::max<size_t>(1, audio::ms_to_samples(frame_ms, sample_rate));
    bool open = false;
    int64_t start_ms = 0;

    for (size_t offset = 0; offset < audio.size(); offset += window) {
        size_t end = std::min(offset + window, audio.size());
        AudioFrame frame(audio.begin() + static_cast<std::ptrdiff_t>(offset),
                         audio.begin() + static_cast<std::ptrdiff_t>(end));
        bool is_speech = detector.detect(frame) > config.threshold;
        int64_t t = audio::samples_to_ms(offset, sample_rate);

        if (is_speech && !open) {
            open = true;
            start_ms = t;
        } else if (!is_speech && open) {
            if (t - start_ms >= config.min_speech_ms) {
                spans.push_back({start_ms, t});
            }
            open = false;
        }
    }

    if (open) {
        int64_t end_ms = audio::samples_to_ms(audio.size(), sample_rate);
        if (end_ms - start_ms >= config.min_speech_ms) {
            spans.push_back({start_ms, end_ms});
        }
    }

    return spans;
}

} // namespace holo_oracle
