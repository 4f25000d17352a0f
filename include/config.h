#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

#include "core/constants.h"

namespace holo_oracle {

struct ServerConfig {
    std::string host = "localhost";
    int port = 7081;
    /// Inbound PCM16 rate, fixed for every session
    int sample_rate = constants::audio::INPUT_SAMPLE_RATE;
    /// Detector frame length; audio chunks are re-framed to this duration
    int frame_ms = constants::audio::FRAME_MS;
    /// Advertised client chunk size in samples (0.5 s at sample_rate)
    int chunk_size = 8000;
    /// Largest reassembled inbound message accepted (bytes)
    size_t max_message_bytes = 4 * 1024 * 1024;
};

struct VADConfig {
    float threshold = constants::vad::THRESHOLD;
    int min_speech_ms = constants::vad::MIN_SPEECH_MS;
    int hangover_ms = constants::vad::HANGOVER_MS;
    int max_speech_ms = constants::vad::MAX_SPEECH_MS;
    /// Try the WebRTC classifier first; energy detector when false or on load failure
    bool use_model = true;
    int model_mode = constants::vad::CLASSIFIER_MODE;  ///< Aggressiveness 0-3
    float energy_threshold = constants::vad::ENERGY_THRESHOLD;
    float energy_high_freq_threshold = constants::vad::ENERGY_HIGH_FREQ_THRESHOLD;
};

struct FAQConfig {
    bool enabled = true;
    std::string database_path = "data/faq_database.json";
    /// Source transcript used to build the table when no database exists
    std::string transcript_path;
    float similarity_threshold = constants::faq::SIMILARITY_THRESHOLD;
    /// Queries with fewer words never match (0 = no guard)
    int min_query_words = 0;
};

struct NeuralTTSConfig {
    bool enabled = false;
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4o-audio-preview";
    std::string voice = "onyx";
    std::string api_key_env = "OPENAI_API_KEY";
    int timeout_ms = constants::tts::NEURAL_TIMEOUT_MS;
    int native_sample_rate = constants::tts::NEURAL_NATIVE_RATE;
    std::string instructions = "Read the following text aloud exactly as written, in a warm, "
                               "gravelly, unhurried Midwestern voice.";
};

struct OfflineTTSConfig {
    bool enabled = true;
    std::string executable = "espeak-ng";  ///< Name on $PATH or absolute path
    std::string language = "en";           ///< Voice enumeration filter
    std::string voice;                     ///< Explicit voice (empty = scored selection)
    int timeout_ms = constants::tts::OFFLINE_TIMEOUT_MS;
};

struct TTSConfig {
    int output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;
    size_t cache_entries = constants::tts::CACHE_ENTRIES;  ///< 0 disables the cache
    NeuralTTSConfig neural;
    OfflineTTSConfig offline;
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";
    std::string blank_sentinel = "[BLANK_AUDIO]";  ///< Treat this exact string (after trim) as blank
    bool use_gpu = false;
    int threads = 4;
};

struct LLMConfig {
    std::string provider = "openai";  ///< "openai" | "ollama"
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model_name = "gpt-4";
    std::string api_key_env = "OPENAI_API_KEY";
    int timeout_ms = constants::llm::TIMEOUT_MS;
    int max_tokens = constants::llm::MAX_TOKENS;
    float temperature = 0.8f;
    float presence_penalty = 0.6f;
    float frequency_penalty = 0.3f;
    int context_max_turns = constants::llm::CONTEXT_MAX_TURNS;  ///< Only send last N turns
    std::string system_prompt =
        "You are Kurt Vonnegut Jr., the American author (1922-2007), speaking from beyond "
        "with your characteristic wit and wisdom. Be conversational, folksy and "
        "self-deprecating. Mix dark humor with genuine wisdom. Occasionally start important "
        "points with \"Listen:\". Say \"So it goes\" only after mentions of death. "
        "Keep answers short enough to be spoken aloud.";
};

struct SessionConfig {
    size_t max_history = constants::session::MAX_HISTORY;
    int pre_speech_ms = constants::session::PRE_SPEECH_MS;
    int stop_flush_min_ms = constants::session::STOP_FLUSH_MIN_MS;
};

struct LogConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    ServerConfig server;
    VADConfig vad;
    FAQConfig faq;
    TTSConfig tts;
    STTConfig stt;
    LLMConfig llm;
    SessionConfig session;
    LogConfig log;

    /// Missing file or keys keep compiled defaults; parse errors are logged and defaults returned
    static Config load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;
};

/**
 * @brief Read an API key from the environment variable named by env_name
 * @return Key, or empty string when unset
 */
std::string read_api_key(const std::string& env_name);

} // namespace holo_oracle
