/**
 * Backend engines with no model, key or network available: each must
 * degrade without throwing.
 * Run from build dir: ./test_backends
 */

#include "test_common.h"
#include "config.h"
#include "fallback_responses.h"
#include "http_client.h"
#include "llm_client.h"
#include "logger.h"
#include "stt_engine.h"
#include "tts/espeak_tts.h"
#include "tts/neural_tts.h"
#include "vad/fvad_detector.h"
#include <cstdlib>

using namespace holo_oracle;

int main() {
    Logger::initialize(LogLevel::ERROR);
    http::global_init();

    // --- Generation without an endpoint answers from the fallback lines ---
    {
        LLMConfig config;
        config.endpoint.clear();
        LLMClient client(config);
        ASSERT(!client.is_ready());
        ASSERT(client.respond("hello old man", {}) == fallback_response("hello", 0));

        std::string first = client.respond("nothing in particular", {});
        std::string second = client.respond("nothing in particular", {});
        ASSERT(first != second);
    }

    // --- OpenAI provider without a key is not ready ---
    {
        LLMConfig config;
        config.api_key_env = "HOLO_ORACLE_TEST_UNSET_KEY";
        unsetenv(config.api_key_env.c_str());
        LLMClient client(config);
        ASSERT(!client.is_ready());
    }

    // --- Unreachable Ollama endpoint falls back ---
    {
        LLMConfig config;
        config.provider = "ollama";
        config.endpoint = "http://127.0.0.1:9/api/chat";
        config.timeout_ms = 2000;
        LLMClient client(config);
        ASSERT(client.is_ready());
        std::string reply = client.respond("tell me about the war", {{MessageRole::User, "hi"}});
        ASSERT(reply == fallback_response("war", 0));
    }

    // --- A transcript cut mid-character still produces a reply ---
    {
        LLMConfig config;
        config.provider = "ollama";
        config.endpoint = "http://127.0.0.1:9/api/chat";
        config.timeout_ms = 2000;
        LLMClient client(config);
        const std::string truncated = "tell me about the caf\xC3";
        std::vector<Turn> history = {{MessageRole::User, truncated},
                                     {MessageRole::Assistant, "It was a long time ago."}};
        try {
            std::string first = client.respond(truncated, {});
            ASSERT(!first.empty());
            std::string second = client.respond("and the war", history);
            ASSERT(second == fallback_response("war", 1));
        } catch (const std::exception& e) {
            std::cerr << "  respond threw: " << e.what() << "\n";
            ASSERT(false);
        }
    }

    // --- HTTP errors carry the transport failure ---
    {
        auto r = http::post_json("http://127.0.0.1:9/v1/chat/completions", "{}", "", 2000, 1000);
        ASSERT(r.failed());
        ASSERT(!r.error.empty());
    }

    // --- Transcriber without a model ---
    {
        STTConfig config;
        config.model_path.clear();
        WhisperTranscriber stt(config);
        ASSERT(!stt.is_ready());
        ASSERT(!stt.transcribe(AudioBuffer(16000, 0), 16000).has_value());

        config.model_path = "/nonexistent/ggml-base.en.bin";
        WhisperTranscriber missing(config);
        ASSERT(!missing.is_ready());
    }

    // --- Neural synthesis without a key ---
    {
        NeuralTTSConfig config;
        config.enabled = true;
        config.api_key_env = "HOLO_ORACLE_TEST_UNSET_KEY";
        tts::NeuralTTS neural(config, 22050);
        ASSERT(neural.name() == "neural");
        ASSERT(!neural.is_available());
        auto r = neural.synthesize("hello", VoiceSettings{});
        ASSERT(!r.ok());

        setenv("HOLO_ORACLE_TEST_NEURAL_KEY", "test-key", 1);
        config.api_key_env = "HOLO_ORACLE_TEST_NEURAL_KEY";
        config.endpoint = "http://127.0.0.1:9/v1/chat/completions";
        config.timeout_ms = 2000;
        tts::NeuralTTS unreachable(config, 22050);
        ASSERT(unreachable.is_available());
        try {
            auto cut = unreachable.synthesize("caf\xC3", VoiceSettings{});
            ASSERT(!cut.ok());
            ASSERT(cut.engine == "neural");
            ASSERT(!cut.error.empty());
        } catch (const std::exception& e) {
            std::cerr << "  synthesize threw: " << e.what() << "\n";
            ASSERT(false);
        }
        unsetenv("HOLO_ORACLE_TEST_NEURAL_KEY");

        config.enabled = false;
        tts::NeuralTTS disabled(config, 22050);
        ASSERT(!disabled.is_available());
    }

    // --- Offline synthesis with a missing executable ---
    {
        OfflineTTSConfig config;
        config.executable = "/nonexistent/espeak-ng";
        tts::EspeakTTS espeak(config, 22050);
        ASSERT(!espeak.is_available());
        ASSERT(!espeak.synthesize("hello", VoiceSettings{}).ok());
        ASSERT(espeak.selected_voice().empty());
    }

    // --- Detector selection ---
    {
        VADConfig config;
        config.use_model = false;
        auto energy = vad::make_speech_detector(config, 16000);
        ASSERT(energy != nullptr);
        ASSERT(energy->name() == "energy");

        config.use_model = true;
        auto model = vad::make_speech_detector(config, 16000);
        ASSERT(model->name() == "webrtc");
        ASSERT(model->model_based());
        ASSERT(model->detect(AudioFrame(1600, 0)) == 0.0f);
        ASSERT(model->detect(AudioFrame(100, 0)) == 0.0f);
        model->reset();

        // Odd input rates are resampled to a classifier rate
        vad::FvadDetector odd(2, 22050);
        ASSERT(odd.detect(AudioFrame(2205, 0)) == 0.0f);

        // An invalid aggressiveness falls back to the energy detector
        config.model_mode = 7;
        auto fallback = vad::make_speech_detector(config, 16000);
        ASSERT(fallback->name() == "energy");
    }

    http::global_cleanup();
    return report("backends");
}
