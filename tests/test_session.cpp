/**
 * Session conversation flow with scripted collaborators.
 * Run from build dir: ./test_session
 */

#include "test_common.h"
#include "audio_codec.h"
#include "config.h"
#include "faq/faq_router.h"
#include "logger.h"
#include "session.h"
#include "tts/synthesis_chain.h"
#include <nlohmann/json.hpp>

using namespace holo_oracle;
using json = nlohmann::json;

namespace {

const size_t FRAME = 1600;  // 100 ms at 16 kHz

Config make_config() {
    Config c;
    c.server.sample_rate = 16000;
    c.server.frame_ms = 100;
    c.vad.threshold = 0.5f;
    c.vad.min_speech_ms = 500;
    c.vad.hangover_ms = 1000;
    c.vad.max_speech_ms = 30000;
    c.session.max_history = 4;
    c.session.pre_speech_ms = 300;
    c.session.stop_flush_min_ms = 1000;
    c.faq.database_path.clear();
    return c;
}

/// Single fake engine; `handle` keeps a non-owning pointer for assertions
std::vector<std::unique_ptr<tts::ISynthesizer>> one_engine(test::SynthMode mode,
                                                           test::FakeSynthesizer*& handle) {
    auto engine = std::make_unique<test::FakeSynthesizer>("espeak-ng", mode);
    handle = engine.get();
    std::vector<std::unique_ptr<tts::ISynthesizer>> engines;
    engines.push_back(std::move(engine));
    return engines;
}

/// Owns a session and every collaborator it borrows
struct Harness {
    explicit Harness(test::SynthMode mode = test::SynthMode::Succeed, bool with_faq = false)
        : config(make_config())
        , synth(nullptr)
        , chain(one_engine(mode, synth), 22050)
        , router(config.faq)
        , services{config, with_faq ? &router : nullptr, transcriber, responder, chain}
    {
        if (with_faq) {
            router.initialize();
        }
        session = std::make_unique<Session>(
            "client_1_1000", services,
            []() {
                auto d = std::make_unique<test::AmplitudeDetector>();
                return std::unique_ptr<vad::ISpeechDetector>(std::move(d));
            },
            [this](const std::string& msg) {
                sent.push_back(json::parse(msg));
                if (!cancel_after.empty() && flow_key(sent.back()) == cancel_after) {
                    session->cancel();
                }
            });
    }

    /// "type", or "status:<status>" for status messages
    static std::string flow_key(const json& m) {
        std::string t = m["type"].get<std::string>();
        if (t == "status") t += ":" + m["status"].get<std::string>();
        return t;
    }

    void send(const json& j) { session->handle_message(j.dump()); }

    void send_type(const std::string& type) { send({{"type", type}}); }

    void send_text(const std::string& text) { send({{"type", "transcribed_text"}, {"text", text}}); }

    /// frames * 100 ms of constant audio (0 = silence for the amplitude detector)
    void send_audio(size_t frames, Sample value) {
        send({{"type", "audio_chunk"},
              {"data", codec::encode_pcm16_base64(AudioBuffer(frames * FRAME, value))}});
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& m : sent) out.push_back(m["type"].get<std::string>());
        return out;
    }

    /// Message types excluding per-frame detector results
    std::vector<std::string> flow() const {
        std::vector<std::string> out;
        for (const auto& m : sent) {
            if (m["type"] == "vad_result") continue;
            out.push_back(flow_key(m));
        }
        return out;
    }

    size_t count(const std::string& type) const {
        size_t n = 0;
        for (const auto& m : sent) {
            if (m["type"] == type) n++;
        }
        return n;
    }

    const json* last(const std::string& type) const {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
            if ((*it)["type"] == type) return &*it;
        }
        return nullptr;
    }

    Config config;
    test::FakeTranscriber transcriber;
    test::FakeResponder responder;
    test::FakeSynthesizer* synth;  // owned by chain
    tts::SynthesisChain chain;
    faq::FaqRouter router;
    SessionServices services;
    std::vector<json> sent;
    std::string cancel_after;  ///< Cancel the session once this flow key is sent
    std::unique_ptr<Session> session;
};

using Flow = std::vector<std::string>;

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Welcome ---
    {
        Harness h;
        h.session->send_welcome();
        ASSERT(h.sent.size() == 1);
        const json& w = h.sent[0];
        ASSERT(w["type"] == "welcome");
        ASSERT(w["client_id"] == "client_1_1000");
        ASSERT(w["server_info"]["sample_rate"] == 16000);
        ASSERT(w["server_info"]["output_sample_rate"] == 22050);
        ASSERT(w["server_info"]["engines"][0]["name"] == "espeak-ng");
        ASSERT(w["server_info"]["faq_entries"] == 0);
        ASSERT(h.session->state() == State::Idle);
    }

    // --- Typed text goes straight to the reply ---
    {
        Harness h;
        h.send_text("  What do you think of people?  ");
        ASSERT(h.flow() == Flow({"status:processing", "status:speaking", "voice_response", "status:idle"}));
        ASSERT(h.responder.calls == 1);
        ASSERT(h.responder.last_prompt == "What do you think of people?");
        ASSERT(h.responder.last_history_size == 0);

        const json* v = h.last("voice_response");
        ASSERT(v != nullptr);
        if (v) {
            ASSERT((*v)["text"] == "reply 1");
            ASSERT((*v)["sample_rate"] == 22050);
            auto audio = codec::decode_pcm16_base64((*v)["audio_data"].get<std::string>());
            ASSERT(audio.ok() && audio.value->size() == 2205);
        }
        ASSERT(h.synth->last_text == "reply 1");
        ASSERT(h.session->state() == State::Idle);
        ASSERT(h.session->history().size() == 2);

        // Empty text is ignored
        size_t before = h.sent.size();
        h.send_text("   ");
        ASSERT(h.sent.size() == before);
    }

    // --- Synthesis failure degrades to text ---
    {
        Harness h(test::SynthMode::Error);
        h.send_text("hello there");
        ASSERT(h.flow() == Flow({"status:processing", "status:speaking", "text_response", "status:idle"}));
        const json* t = h.last("text_response");
        ASSERT(t != nullptr);
        if (t) {
            ASSERT((*t)["text"] == "reply 1");
            ASSERT(!t->contains("audio_data"));
        }
        ASSERT(h.session->state() == State::Idle);
    }

    // --- Responder failure uses the apology line ---
    {
        Harness h;
        h.responder.throw_error = true;
        h.send_text("anything");
        const json* v = h.last("voice_response");
        ASSERT(v != nullptr);
        if (v) {
            ASSERT((*v)["text"].get<std::string>().find("trouble connecting") != std::string::npos);
        }
        ASSERT(h.session->history().size() == 2);
    }

    // --- History is capped and passed to the responder ---
    {
        Harness h;
        h.send_text("one");
        h.send_text("two");
        h.send_text("three");
        ASSERT(h.responder.calls == 3);
        ASSERT(h.responder.last_history_size == 4);
        ASSERT(h.session->history().size() == 4);
        auto turns = h.session->history().turns();
        ASSERT(turns.front().text == "two");
        ASSERT(turns.back().text == "reply 3");
    }

    // --- Canned answers bypass generation ---
    {
        Harness h(test::SynthMode::Succeed, true);
        h.session->send_welcome();
        ASSERT(h.sent[0]["server_info"]["faq_entries"] == 4);
        h.sent.clear();

        h.send_text("So it goes");
        ASSERT(h.flow() == Flow({"status:processing", "faq_response", "status:speaking",
                                 "voice_response", "status:idle"}));
        ASSERT(h.responder.calls == 0);
        ASSERT(h.session->history().empty());
        const json* f = h.last("faq_response");
        if (f) {
            ASSERT((*f)["text"] == "So it goes. That is what I say about death and dying.");
            ASSERT((*f)["confidence"].get<double>() >= 0.7);
        }
        const json* v = h.last("voice_response");
        if (v) {
            ASSERT((*v)["text"] == "So it goes. That is what I say about death and dying.");
        }

        // A miss falls through to the responder
        h.send_text("what is the weather like today");
        ASSERT(h.responder.calls == 1);
        ASSERT(h.session->history().size() == 2);
    }

    // --- Speech followed by silence is transcribed and answered ---
    {
        Harness h;
        h.send_type("start_listening");
        ASSERT(h.session->state() == State::Listening);
        ASSERT(h.flow() == Flow({"status:listening"}));

        // 0.5 s chunks: silence, speech, speech, silence, silence
        h.send_audio(5, 0);
        ASSERT(h.count("vad_result") == 5);
        ASSERT(h.session->buffered_samples() == 3 * FRAME);  // pre-speech pad only
        h.send_audio(5, 1000);
        h.send_audio(5, 1000);
        ASSERT(h.session->state() == State::Listening);
        h.send_audio(5, 0);
        ASSERT(h.session->state() == State::Listening);  // still inside the hangover
        ASSERT(h.transcriber.calls == 0);
        h.send_audio(5, 0);

        ASSERT(h.count("vad_result") == 25);
        ASSERT(h.transcriber.calls == 1);
        // pad (3 frames) + 10 speech frames + 10 hangover frames
        ASSERT(h.transcriber.last_samples == 23 * FRAME);
        ASSERT(h.transcriber.last_rate == 16000);

        ASSERT(h.flow() == Flow({"status:listening", "status:processing_speech", "transcription",
                                 "status:speaking", "voice_response", "status:idle"}));
        const json* t = h.last("transcription");
        ASSERT(t && (*t)["text"] == "tell me something");
        ASSERT(h.responder.last_prompt == "tell me something");
        ASSERT(h.session->state() == State::Idle);
        ASSERT(h.session->buffered_samples() == 0);

        // vad_result marks speech frames
        bool saw_speech = false;
        for (const auto& m : h.sent) {
            if (m["type"] == "vad_result" && m["is_speech"] == true) saw_speech = true;
        }
        ASSERT(saw_speech);

        // Audio is ignored until listening is restarted
        size_t before = h.sent.size();
        h.send_audio(5, 1000);
        ASSERT(h.sent.size() == before);
    }

    // --- An utterance past max_speech_ms is force-flushed through the pipeline ---
    {
        Harness h;
        h.send_type("start_listening");
        for (int i = 0; i < 7; ++i) {
            h.send_audio(50, 1000);  // 7 x 5 s of continuous speech
        }

        ASSERT(h.transcriber.calls == 1);
        ASSERT(h.transcriber.last_samples == 302 * FRAME);
        ASSERT(h.flow() == Flow({"status:listening", "status:processing_speech", "transcription",
                                 "status:speaking", "voice_response", "status:idle"}));
        ASSERT(h.synth->calls == 1);
        ASSERT(h.session->state() == State::Idle);
        ASSERT(h.session->buffered_samples() == 0);
    }

    // --- Disconnect during transcription stops the turn before the reply ---
    {
        Harness h;
        h.cancel_after = "transcription";
        h.send_type("start_listening");
        h.send_audio(10, 1000);
        h.send_audio(15, 0);

        ASSERT(h.transcriber.calls == 1);
        ASSERT(h.responder.calls == 0);
        ASSERT(h.synth->calls == 0);
        ASSERT(h.flow() == Flow({"status:listening", "status:processing_speech", "transcription"}));
        ASSERT(h.session->cancelled());
        ASSERT(h.session->state() == State::Idle);
        ASSERT(h.session->buffered_samples() == 0);

        size_t before = h.sent.size();
        h.send_type("start_listening");
        h.send_text("anyone there");
        ASSERT(h.sent.size() == before);
    }

    // --- Disconnect after the reply is chosen skips synthesis ---
    {
        Harness h(test::SynthMode::Succeed, true);
        h.cancel_after = "faq_response";
        h.send_text("So it goes");
        ASSERT(h.flow() == Flow({"status:processing", "faq_response"}));
        ASSERT(h.synth->calls == 0);
        ASSERT(h.session->state() == State::Idle);
    }

    // --- Disconnect before a typed reply skips generation ---
    {
        Harness h;
        h.cancel_after = "status:processing";
        h.send_text("tell me about Dresden");
        ASSERT(h.responder.calls == 0);
        ASSERT(h.synth->calls == 0);
        ASSERT(h.flow() == Flow({"status:processing"}));
        ASSERT(h.session->history().empty());
    }

    // --- Short blips never reach the transcriber ---
    {
        Harness h;
        h.send_type("start_listening");
        h.send_audio(2, 1000);
        h.send_audio(15, 0);
        ASSERT(h.transcriber.calls == 0);
        ASSERT(h.session->state() == State::Listening);
        ASSERT(h.session->buffered_samples() <= 3 * FRAME);
    }

    // --- Chunks that are not frame multiples are re-framed ---
    {
        Harness h;
        h.send_type("start_listening");
        h.send({{"type", "audio_chunk"}, {"data", codec::encode_pcm16_base64(AudioBuffer(2500, 0))}});
        ASSERT(h.count("vad_result") == 1);
        h.send({{"type", "audio_chunk"}, {"data", codec::encode_pcm16_base64(AudioBuffer(700, 0))}});
        ASSERT(h.count("vad_result") == 2);

        // Undecodable audio is dropped
        h.send({{"type", "audio_chunk"}, {"data", "***"}});
        ASSERT(h.count("vad_result") == 2);
        ASSERT(h.session->state() == State::Listening);
    }

    // --- stop_listening flushes a long utterance ---
    {
        Harness h;
        h.send_type("start_listening");
        h.send_audio(15, 1000);
        ASSERT(h.transcriber.calls == 0);
        h.send_type("stop_listening");
        ASSERT(h.transcriber.calls == 1);
        ASSERT(h.transcriber.last_samples == 15 * FRAME);
        ASSERT(h.count("voice_response") == 1);
        ASSERT(h.session->state() == State::Idle);
    }

    // --- stop_listening discards a short utterance ---
    {
        Harness h;
        h.send_type("start_listening");
        h.send_audio(5, 1000);
        h.send_type("stop_listening");
        ASSERT(h.transcriber.calls == 0);
        ASSERT(h.flow() == Flow({"status:listening", "status:idle"}));
        ASSERT(h.session->state() == State::Idle);
        ASSERT(h.session->buffered_samples() == 0);
    }

    // --- Nothing transcribed ---
    {
        Harness h;
        h.transcriber.reply = std::nullopt;
        h.send_type("start_listening");
        h.send_audio(15, 1000);
        h.send_type("stop_listening");
        ASSERT(h.flow() == Flow({"status:listening", "status:processing_speech", "error", "status:idle"}));
        const json* e = h.last("error");
        ASSERT(e && (*e)["message"] == "Could not transcribe audio");
        ASSERT(h.responder.calls == 0);
        ASSERT(h.session->state() == State::Idle);
    }

    // --- Transcriber exception is reported the same way ---
    {
        Harness h;
        h.transcriber.throw_error = true;
        h.send_type("start_listening");
        h.send_audio(15, 1000);
        h.send_type("stop_listening");
        const json* e = h.last("error");
        ASSERT(e && (*e)["message"] == "Could not transcribe audio");
        ASSERT(h.session->state() == State::Idle);
    }

    // --- Control messages ---
    {
        Harness h;
        h.send_type("ping");
        ASSERT(h.types() == std::vector<std::string>({"pong"}));

        h.send({{"type", "voice_settings"}, {"settings", {{"speed", 200}, {"volume", 0.5}}}});
        const json* s = h.last("settings_updated");
        ASSERT(s != nullptr);
        if (s) {
            ASSERT((*s)["settings"]["speed"] == 200);
            ASSERT_NEAR((*s)["settings"]["volume"].get<double>(), 0.5, 1e-6);
        }
        ASSERT(h.session->voice_settings().speed == 200);

        h.send_text("speak faster");
        ASSERT(h.synth->last_speed == 200);

        // Malformed and unknown messages are dropped silently
        size_t before = h.sent.size();
        h.session->handle_message("{not json");
        h.session->handle_message("[]");
        h.send_type("dance");
        h.send({{"kind", "ping"}});
        ASSERT(h.sent.size() == before);
        ASSERT(h.session->state() == State::Idle);

        // stop_listening while idle is a no-op
        h.send_type("stop_listening");
        ASSERT(h.sent.size() == before);
    }

    return report("session");
}
