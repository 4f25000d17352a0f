/**
 * Configuration loading, path helpers, protocol parsing, history and
 * fallback lines.
 * Run from build dir: ./test_config
 */

#include "test_common.h"
#include "config.h"
#include "fallback_responses.h"
#include "logger.h"
#include "memory/conversation_history.h"
#include "path_utils.h"
#include "protocol.h"
#include "utils.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace holo_oracle;
using json = nlohmann::json;
namespace fs = std::filesystem;

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Partial config keeps defaults ---
    {
        std::string dir = test::make_temp_dir("config");
        std::string path = dir + "/config.json";
        {
            std::ofstream out(path);
            out << R"({
                "server": {"port": 9001},
                "vad": {"threshold": 0.6, "use_model": false},
                "faq": {"database_path": "~/oracle/faq.json", "min_query_words": 2},
                "tts": {"neural": {"enabled": true, "voice": "echo"}},
                "llm": {"provider": "ollama", "context_max_turns": 4},
                "log": {"level": "debug"}
            })";
        }

        Config c = Config::load_from_file(path);
        ASSERT(c.server.port == 9001);
        ASSERT(c.server.host == "localhost");
        ASSERT(c.server.sample_rate == 16000);
        ASSERT(c.server.frame_ms == 100);
        ASSERT_NEAR(c.vad.threshold, 0.6, 1e-6);
        ASSERT(!c.vad.use_model);
        ASSERT(c.vad.hangover_ms == 1000);
        ASSERT(c.faq.min_query_words == 2);
        ASSERT(c.tts.neural.enabled);
        ASSERT(c.tts.neural.voice == "echo");
        ASSERT(c.tts.neural.model == "gpt-4o-audio-preview");
        ASSERT(c.tts.offline.executable == "espeak-ng");
        ASSERT(c.llm.provider == "ollama");
        ASSERT(c.llm.context_max_turns == 4);
        ASSERT(c.session.max_history == 20);
        ASSERT(c.log.level == "debug");

        const char* home = std::getenv("HOME");
        if (home) {
            ASSERT(c.faq.database_path == std::string(home) + "/oracle/faq.json");
        }

        // Save and reload
        c.server.port = 9100;
        c.tts.cache_entries = 0;
        std::string saved = dir + "/saved.json";
        ASSERT(c.save_to_file(saved));
        Config r = Config::load_from_file(saved);
        ASSERT(r.server.port == 9100);
        ASSERT(r.tts.cache_entries == 0);
        ASSERT(r.llm.provider == "ollama");
        ASSERT(r.llm.system_prompt == c.llm.system_prompt);

        // Unreadable or malformed files give defaults
        Config missing = Config::load_from_file(dir + "/missing.json");
        ASSERT(missing.server.port == 7081);
        {
            std::ofstream out(dir + "/bad.json");
            out << "{ \"server\": ";
        }
        Config bad = Config::load_from_file(dir + "/bad.json");
        ASSERT(bad.server.port == 7081);

        fs::remove_all(dir);
    }

    // --- Paths ---
    {
        ASSERT(expand_path("").empty());
        ASSERT(expand_path("/abs/path") == "/abs/path");
        ASSERT(expand_path("rel/~path") == "rel/~path");
        const char* home = std::getenv("HOME");
        if (home) {
            ASSERT(expand_path("~") == std::string(home));
            ASSERT(expand_path("~/x") == std::string(home) + "/x");
        }
        ASSERT(find_executable("").empty());
        ASSERT(find_executable("/definitely/not/here").empty());
        ASSERT(find_executable("holo-oracle-no-such-binary").empty());
        ASSERT(!find_executable("sh").empty());

        std::string tmp = make_temp_path("holo_oracle_test", ".wav");
        ASSERT(!tmp.empty());
        ASSERT(file_exists(tmp));
        std::remove(tmp.c_str());
        ASSERT(!file_exists(tmp));
    }

    // --- Log levels ---
    ASSERT(parse_log_level("debug") == LogLevel::DEBUG);
    ASSERT(parse_log_level(" WARNING ") == LogLevel::WARN);
    ASSERT(parse_log_level("error") == LogLevel::ERROR);
    ASSERT(parse_log_level("verbose") == LogLevel::INFO);

    // --- Transcript text helpers ---
    ASSERT(utils::is_blank_transcript(""));
    ASSERT(utils::is_blank_transcript("  [BLANK_AUDIO] "));
    ASSERT(utils::is_blank_transcript("[MUSIC]"));
    ASSERT(!utils::is_blank_transcript("So it goes."));
    ASSERT(utils::split_words("So, it goes.") == std::vector<std::string>({"so", "it", "goes"}));

    // --- Inbound protocol ---
    {
        auto chunk = protocol::parse_inbound(R"({"type":"audio_chunk","data":"AAA="})");
        ASSERT(chunk.ok());
        if (chunk.ok()) {
            ASSERT(chunk.value->type == protocol::InboundType::AudioChunk);
            ASSERT(chunk.value->data == "AAA=");
        }

        auto text = protocol::parse_inbound(R"({"type":"transcribed_text","text":"hi"})");
        ASSERT(text.ok() && text.value->text == "hi");

        auto settings = protocol::parse_inbound(
            R"({"type":"voice_settings","settings":{"speed":180,"volume":"loud","emotion":0.2}})");
        ASSERT(settings.ok());
        if (settings.ok()) {
            VoiceSettings v;
            settings.value->settings.apply_to(v);
            ASSERT(v.speed == 180);
            ASSERT_NEAR(v.volume, 0.9, 1e-6);  // non-numeric ignored
            ASSERT_NEAR(v.emotion, 0.2, 1e-6);
            ASSERT_NEAR(v.intensity, 1.0, 1e-6);
        }

        ASSERT(protocol::parse_inbound(R"({"type":"ping"})").ok());
        ASSERT(protocol::parse_inbound(R"({"type":"start_listening"})").ok());
        ASSERT(protocol::parse_inbound("not json").failed());
        ASSERT(protocol::parse_inbound("[1,2]").failed());
        ASSERT(protocol::parse_inbound(R"({"text":"no type"})").failed());
        ASSERT(protocol::parse_inbound(R"({"type":42})").failed());
        ASSERT(protocol::parse_inbound(R"({"type":"dance"})").failed());
    }

    // --- Outbound protocol ---
    {
        protocol::ServerInfo info;
        info.sample_rate = 16000;
        info.output_sample_rate = 22050;
        info.frame_ms = 100;
        info.chunk_size = 8000;
        info.engines = {{"neural", false}, {"espeak-ng", true}};
        info.faq_entries = 4;
        json w = json::parse(protocol::make_welcome("client_1_2", info));
        ASSERT(w["type"] == "welcome");
        ASSERT(w["client_id"] == "client_1_2");
        ASSERT(w["server_info"]["sample_rate"] == 16000);
        ASSERT(w["server_info"]["supported_formats"][0] == "pcm16");
        ASSERT(w["server_info"]["engines"].size() == 2);
        ASSERT(w["server_info"]["engines"][1]["available"] == true);
        ASSERT(w["server_info"]["faq_entries"] == 4);

        json v = json::parse(protocol::make_voice_response("hi", {1, 2}, 22050));
        ASSERT(v["type"] == "voice_response");
        ASSERT(v["audio_data"] == "AQACAA==");
        ASSERT(v["sample_rate"] == 22050);

        // Invalid UTF-8 from a backend must not break serialization
        json e = json::parse(protocol::make_text_response("bad \xFF byte"));
        ASSERT(e["type"] == "text_response");

        ASSERT(json::parse(protocol::make_pong())["type"] == "pong");
        json vad = json::parse(protocol::make_vad_result(0.75f, true));
        ASSERT(vad["is_speech"] == true);
    }

    // --- Conversation history ---
    {
        memory::ConversationHistory history(4);
        ASSERT(history.empty());
        history.add_exchange("q1", "a1");
        history.add_exchange("q2", "a2");
        history.add_exchange("q3", "a3");
        ASSERT(history.size() == 4);
        auto turns = history.turns();
        ASSERT(turns.front().text == "q2");
        ASSERT(turns.front().role == MessageRole::User);
        ASSERT(turns.back().text == "a3");
        ASSERT(turns.back().role == MessageRole::Assistant);

        auto recent = history.recent(2);
        ASSERT(recent.size() == 2);
        ASSERT(recent[0].text == "q3");
        ASSERT(history.recent(10).size() == 4);

        memory::ConversationHistory none(0);
        none.add_user_message("dropped");
        ASSERT(none.empty());

        history.clear();
        ASSERT(history.size() == 0);
    }

    // --- Fallback lines ---
    {
        std::string greeting = fallback_response("Hello there", 0);
        ASSERT(greeting.find("Hi ho") == 0);
        ASSERT(fallback_response("what is the meaning of it all", 0).find("fart around") != std::string::npos);
        ASSERT(fallback_response("tell me about Dresden", 0).find("children's crusade") != std::string::npos);
        // "this" contains "hi" but is not a greeting
        std::string generic = fallback_response("this weather", 1);
        ASSERT(generic == fallback_response("something else", 1 + fallback_generic_count()));
        ASSERT(fallback_response("something else", 0) != fallback_response("something else", 1));
        ASSERT(fallback_generic_count() == 4);
    }

    return report("config");
}
