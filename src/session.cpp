#include "session.h"
#include "audio_codec.h"
#include "faq/faq_router.h"
#include "llm_client.h"
#include "logger.h"
#include "path_utils.h"
#include "protocol.h"
#include "stt_engine.h"
#include "tts/synthesis_chain.h"
#include "utils.h"
#include "vad/vad_interface.h"
#include "vad_endpointing.h"
#include <algorithm>
#include <atomic>
#include <sstream>

namespace holo_oracle {

namespace {
const char* const TRANSCRIBE_FAILED = "Could not transcribe audio";
const char* const RESPONDER_ERROR_LINE =
    "Listen: I seem to be having trouble connecting to my thoughts right now. So it goes.";
}

class Session::Impl {
public:
    Impl(std::string id,
         const SessionServices& services,
         const DetectorFactory& make_detector,
         MessageSink sink)
        : id_(std::move(id))
        , services_(services)
        , config_(services.config)
        , sink_(std::move(sink))
        , detector_(make_detector())
        , endpointing_(services.config.vad)
        , history_(services.config.session.max_history)
        , created_at_ms_(now_ms())
    {
        sample_rate_ = config_.server.sample_rate;
        frame_samples_ = std::max<size_t>(1, audio::ms_to_samples(config_.server.frame_ms, sample_rate_));
        pad_samples_ = audio::ms_to_samples(config_.session.pre_speech_ms, sample_rate_);

        LOG_SESSION(id_, "Created (detector=" + detector_->name() + ")");
    }

    ~Impl() {
        std::ostringstream oss;
        oss << "Closed after " << (now_ms() - created_at_ms_) << "ms, "
            << history_.size() << " history turns";
        LOG_SESSION(id_, oss.str());
    }

    void send_welcome() {
        protocol::ServerInfo info;
        info.sample_rate = sample_rate_;
        info.output_sample_rate = services_.synthesis.output_sample_rate();
        info.frame_ms = config_.server.frame_ms;
        info.chunk_size = config_.server.chunk_size;
        info.engines = services_.synthesis.engines();
        info.faq_entries = services_.faq ? services_.faq->size() : 0;
        send(protocol::make_welcome(id_, info));
    }

    void handle_message(const std::string& raw) {
        if (cancelled_) return;

        auto parsed = protocol::parse_inbound(raw);
        if (parsed.failed()) {
            LOG_WARN("[Session " + id_ + "] Ignoring message: " + parsed.error);
            return;
        }

        try {
            dispatch(*parsed.value);
        } catch (const std::exception& e) {
            LOG_ERROR("[Session " + id_ + "] Error handling message: " + e.what());
            clear_audio();
            state_.on_finished();
            send(protocol::make_error("Error processing message"));
        }
    }

    const std::string& id() const { return id_; }
    State state() const { return state_.get_state(); }
    const memory::ConversationHistory& history() const { return history_; }
    const VoiceSettings& voice_settings() const { return voice_settings_; }
    size_t buffered_samples() const { return utterance_.size() + pending_.size(); }

    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

private:
    void dispatch(const protocol::InboundMessage& msg) {
        switch (msg.type) {
            case protocol::InboundType::StartListening:
                start_listening();
                break;
            case protocol::InboundType::StopListening:
                stop_listening();
                break;
            case protocol::InboundType::AudioChunk:
                on_audio_chunk(msg.data);
                break;
            case protocol::InboundType::TranscribedText:
                on_text(msg.text);
                break;
            case protocol::InboundType::VoiceSettings:
                msg.settings.apply_to(voice_settings_);
                {
                    std::ostringstream oss;
                    oss << "Voice settings updated: speed=" << voice_settings_.speed
                        << " volume=" << voice_settings_.volume;
                    LOG_SESSION(id_, oss.str());
                }
                send(protocol::make_settings_updated(voice_settings_));
                break;
            case protocol::InboundType::Ping:
                send(protocol::make_pong());
                break;
        }
    }

    // =========================================================================
    // Listening
    // =========================================================================

    void start_listening() {
        if (!state_.on_start_listening()) {
            LOG_WARN("[Session " + id_ + "] start_listening ignored in state " +
                     state_to_string(state_.get_state()));
            return;
        }
        clear_audio();
        LOG_SESSION(id_, "Listening");
        send(protocol::make_status("listening"));
    }

    void stop_listening() {
        if (state_.get_state() != State::Listening) {
            state_.on_finished();
            return;
        }

        // Partial trailing frame still belongs to the utterance
        utterance_.insert(utterance_.end(), pending_.begin(), pending_.end());
        pending_.clear();

        int64_t open_ms = endpointing_.is_speaking()
            ? audio::samples_to_ms(samples_seen_, sample_rate_) - endpointing_.speech_start_ms()
            : 0;

        if (endpointing_.is_speaking() && open_ms >= config_.session.stop_flush_min_ms) {
            LOG_SESSION(id_, "stop_listening: flushing " + std::to_string(open_ms) + "ms utterance");
            AudioBuffer utterance = std::move(utterance_);
            clear_audio();
            state_.on_begin_processing();
            process_utterance(utterance);
            return;
        }

        LOG_SESSION(id_, "Stopped listening");
        clear_audio();
        finish();
    }

    void on_audio_chunk(const std::string& data) {
        if (state_.get_state() != State::Listening) {
            LOG_DEBUG("[Session " + id_ + "] Audio ignored in state " + state_to_string(state_.get_state()));
            return;
        }

        auto samples = codec::decode_pcm16_base64(data);
        if (samples.failed()) {
            LOG_WARN("[Session " + id_ + "] Bad audio_chunk: " + samples.error);
            return;
        }

        pending_.insert(pending_.end(), samples.value->begin(), samples.value->end());

        size_t offset = 0;
        while (state_.get_state() == State::Listening && pending_.size() - offset >= frame_samples_) {
            AudioFrame frame(pending_.begin() + static_cast<std::ptrdiff_t>(offset),
                             pending_.begin() + static_cast<std::ptrdiff_t>(offset + frame_samples_));
            offset += frame_samples_;
            process_frame(frame);
        }

        if (state_.get_state() == State::Listening) {
            pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
        } else {
            pending_.clear();
        }
    }

    void process_frame(const AudioFrame& frame) {
        int64_t ts = audio::samples_to_ms(samples_seen_, sample_rate_);
        samples_seen_ += frame.size();

        float prob = detector_->detect(frame);
        send(protocol::make_vad_result(prob, prob > config_.vad.threshold));

        SegmentEvent event = endpointing_.update(prob, ts);
        utterance_.insert(utterance_.end(), frame.begin(), frame.end());

        switch (event.type) {
            case VADEvent::None:
                trim_to_pad();
                break;
            case VADEvent::SpeechStart:
                LOG_VAD("Session " + id_ + " speech start at " + std::to_string(ts) + "ms");
                break;
            case VADEvent::SpeechContinue:
                break;
            case VADEvent::SpeechEnd:
            case VADEvent::SpeechTimeout:
                on_boundary(event);
                break;
        }
    }

    void on_boundary(const SegmentEvent& event) {
        std::ostringstream oss;
        oss << vad_event_to_string(event.type) << " after " << event.duration_ms << "ms"
            << (event.valid_speech ? "" : " (too short, discarded)");
        LOG_SESSION(id_, oss.str());

        if (!state_.on_segment_event(event)) {
            trim_to_pad();
            return;
        }

        AudioBuffer utterance = std::move(utterance_);
        clear_audio();
        process_utterance(utterance);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    void process_utterance(const AudioBuffer& utterance) {
        send(protocol::make_status("processing_speech"));

        std::optional<std::string> transcript;
        try {
            transcript = services_.transcriber.transcribe(utterance, sample_rate_);
        } catch (const std::exception& e) {
            LOG_ERROR("[Session " + id_ + "] Transcriber error: " + e.what());
        }

        if (!transcript || utils::is_empty_or_whitespace(*transcript)) {
            LOG_SESSION(id_, "No transcription");
            send(protocol::make_error(TRANSCRIBE_FAILED));
            finish();
            return;
        }

        LOG_SESSION(id_, "Transcribed: " + *transcript);
        send(protocol::make_transcription(*transcript));
        respond(*transcript);
    }

    void on_text(const std::string& raw_text) {
        std::string text = utils::trim_copy(raw_text);
        if (text.empty()) {
            LOG_WARN("[Session " + id_ + "] Ignoring empty transcribed_text");
            return;
        }
        if (!state_.on_begin_processing()) {
            LOG_WARN("[Session " + id_ + "] transcribed_text ignored in state " +
                     state_to_string(state_.get_state()));
            return;
        }

        clear_audio();
        LOG_SESSION(id_, "Received text: " + text);
        send(protocol::make_status("processing"));
        respond(text);
    }

    void respond(const std::string& query) {
        if (abandon_if_cancelled("before reply")) return;

        std::string response_text;
        std::string prerendered_path;

        std::optional<faq::FaqMatch> match;
        if (services_.faq && config_.faq.enabled) {
            match = services_.faq->check(query);
        }

        if (match) {
            response_text = match->text;
            prerendered_path = match->audio_file;
            send(protocol::make_faq_response(match->text, match->confidence));
        } else {
            try {
                response_text = services_.responder.respond(query, history_.turns());
            } catch (const std::exception& e) {
                LOG_ERROR("[Session " + id_ + "] Responder error: " + e.what());
                response_text = RESPONDER_ERROR_LINE;
            }
            history_.add_exchange(query, response_text);
        }

        if (abandon_if_cancelled("before synthesis")) return;

        state_.on_begin_speaking();
        send(protocol::make_status("speaking"));

        AudioBuffer audio;
        int sample_rate = services_.synthesis.output_sample_rate();

        if (!prerendered_path.empty() && file_exists(prerendered_path)) {
            auto loaded = services_.synthesis.load_prerendered(prerendered_path);
            if (loaded.ok()) {
                audio = std::move(*loaded.value);
                LOG_SESSION(id_, "Using pre-rendered audio: " + prerendered_path);
            } else {
                LOG_WARN("[Session " + id_ + "] Pre-rendered audio unusable: " + loaded.error);
            }
        }

        if (audio.empty()) {
            tts::SynthResult synth = services_.synthesis.synthesize(response_text, voice_settings_);
            if (synth.ok()) {
                audio = std::move(synth.audio);
                sample_rate = synth.sample_rate;
            }
        }

        if (abandon_if_cancelled("after synthesis")) return;

        if (!audio.empty()) {
            std::ostringstream oss;
            oss << "Voice response: " << audio::samples_to_ms(audio.size(), sample_rate) << "ms audio";
            LOG_SESSION(id_, oss.str());
            send(protocol::make_voice_response(response_text, audio, sample_rate));
        } else {
            LOG_WARN("[Session " + id_ + "] No audio generated, sending text-only response");
            send(protocol::make_text_response(response_text));
        }

        finish();
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    void finish() {
        state_.on_finished();
        send(protocol::make_status("idle"));
    }

    void clear_audio() {
        pending_.clear();
        utterance_.clear();
        samples_seen_ = 0;
        endpointing_.reset();
        detector_->reset();
    }

    /// Peer is gone: drop the turn and release audio memory
    bool abandon_if_cancelled(const char* stage) {
        if (!cancelled_) return false;
        LOG_SESSION(id_, std::string("Disconnected, abandoning turn ") + stage);
        clear_audio();
        AudioBuffer().swap(pending_);
        AudioBuffer().swap(utterance_);
        state_.on_finished();
        return true;
    }

    void trim_to_pad() {
        if (utterance_.size() > pad_samples_) {
            utterance_.erase(utterance_.begin(),
                             utterance_.end() - static_cast<std::ptrdiff_t>(pad_samples_));
        }
    }

    void send(const std::string& message) {
        if (sink_) sink_(message);
    }

    std::string id_;
    const SessionServices& services_;
    const Config& config_;
    MessageSink sink_;

    std::unique_ptr<vad::ISpeechDetector> detector_;
    VADEndpointing endpointing_;
    StateMachine state_;
    memory::ConversationHistory history_;
    VoiceSettings voice_settings_;

    int sample_rate_ = 0;
    size_t frame_samples_ = 0;
    size_t pad_samples_ = 0;

    AudioBuffer pending_;     ///< Received samples not yet forming a whole frame
    AudioBuffer utterance_;   ///< Pre-speech pad plus the open utterance
    size_t samples_seen_ = 0; ///< Samples fed to the detector since listening started
    std::atomic<bool> cancelled_{false};

    int64_t created_at_ms_;
};

Session::Session(std::string id,
                 const SessionServices& services,
                 const DetectorFactory& make_detector,
                 MessageSink sink)
    : pimpl_(std::make_unique<Impl>(std::move(id), services, make_detector, std::move(sink))) {}

Session::~Session() = default;

void Session::send_welcome() {
    pimpl_->send_welcome();
}

void Session::handle_message(const std::string& raw) {
    pimpl_->handle_message(raw);
}

void Session::cancel() {
    pimpl_->cancel();
}

bool Session::cancelled() const {
    return pimpl_->cancelled();
}

const std::string& Session::id() const {
    return pimpl_->id();
}

State Session::state() const {
    return pimpl_->state();
}

const memory::ConversationHistory& Session::history() const {
    return pimpl_->history();
}

const VoiceSettings& Session::voice_settings() const {
    return pimpl_->voice_settings();
}

size_t Session::buffered_samples() const {
    return pimpl_->buffered_samples();
}

} // namespace holo_oracle
