#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace holo_oracle {

namespace {

/// Apply full JSON config (all sections) into cfg. Absent keys keep their defaults.
void apply_json_to_config(Config& cfg, const json& j) {
    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("host")) cfg.server.host = s["host"];
        if (s.contains("port")) cfg.server.port = s["port"];
        if (s.contains("sample_rate")) cfg.server.sample_rate = s["sample_rate"];
        if (s.contains("frame_ms")) cfg.server.frame_ms = s["frame_ms"];
        if (s.contains("chunk_size")) cfg.server.chunk_size = s["chunk_size"];
        if (s.contains("max_message_bytes")) cfg.server.max_message_bytes = s["max_message_bytes"];
    }

    if (j.contains("vad") && j["vad"].is_object()) {
        auto& v = j["vad"];
        if (v.contains("threshold")) cfg.vad.threshold = v["threshold"];
        if (v.contains("min_speech_ms")) cfg.vad.min_speech_ms = v["min_speech_ms"];
        if (v.contains("hangover_ms")) cfg.vad.hangover_ms = v["hangover_ms"];
        if (v.contains("max_speech_ms")) cfg.vad.max_speech_ms = v["max_speech_ms"];
        if (v.contains("use_model")) cfg.vad.use_model = v["use_model"];
        if (v.contains("model_mode")) cfg.vad.model_mode = v["model_mode"];
        if (v.contains("energy_threshold")) cfg.vad.energy_threshold = v["energy_threshold"];
        if (v.contains("energy_high_freq_threshold"))
            cfg.vad.energy_high_freq_threshold = v["energy_high_freq_threshold"];
    }

    if (j.contains("faq") && j["faq"].is_object()) {
        auto& f = j["faq"];
        if (f.contains("enabled")) cfg.faq.enabled = f["enabled"];
        if (f.contains("database_path")) cfg.faq.database_path = f["database_path"];
        if (f.contains("transcript_path")) cfg.faq.transcript_path = f["transcript_path"];
        if (f.contains("similarity_threshold")) cfg.faq.similarity_threshold = f["similarity_threshold"];
        if (f.contains("min_query_words")) cfg.faq.min_query_words = f["min_query_words"];
    }

    if (j.contains("tts") && j["tts"].is_object()) {
        auto& t = j["tts"];
        if (t.contains("output_sample_rate")) cfg.tts.output_sample_rate = t["output_sample_rate"];
        if (t.contains("cache_entries")) cfg.tts.cache_entries = t["cache_entries"];
        if (t.contains("neural") && t["neural"].is_object()) {
            auto& n = t["neural"];
            if (n.contains("enabled")) cfg.tts.neural.enabled = n["enabled"];
            if (n.contains("endpoint")) cfg.tts.neural.endpoint = n["endpoint"];
            if (n.contains("model")) cfg.tts.neural.model = n["model"];
            if (n.contains("voice")) cfg.tts.neural.voice = n["voice"];
            if (n.contains("api_key_env")) cfg.tts.neural.api_key_env = n["api_key_env"];
            if (n.contains("timeout_ms")) cfg.tts.neural.timeout_ms = n["timeout_ms"];
            if (n.contains("native_sample_rate")) cfg.tts.neural.native_sample_rate = n["native_sample_rate"];
            if (n.contains("instructions")) cfg.tts.neural.instructions = n["instructions"];
        }
        if (t.contains("offline") && t["offline"].is_object()) {
            auto& o = t["offline"];
            if (o.contains("enabled")) cfg.tts.offline.enabled = o["enabled"];
            if (o.contains("executable")) cfg.tts.offline.executable = o["executable"];
            if (o.contains("language")) cfg.tts.offline.language = o["language"];
            if (o.contains("voice")) cfg.tts.offline.voice = o["voice"];
            if (o.contains("timeout_ms")) cfg.tts.offline.timeout_ms = o["timeout_ms"];
        }
    }

    if (j.contains("stt") && j["stt"].is_object()) {
        auto& s = j["stt"];
        if (s.contains("model_path")) cfg.stt.model_path = s["model_path"];
        if (s.contains("language")) cfg.stt.language = s["language"];
        if (s.contains("blank_sentinel")) cfg.stt.blank_sentinel = s["blank_sentinel"];
        if (s.contains("use_gpu")) cfg.stt.use_gpu = s["use_gpu"];
        if (s.contains("threads")) cfg.stt.threads = s["threads"];
    }

    if (j.contains("llm") && j["llm"].is_object()) {
        auto& l = j["llm"];
        if (l.contains("provider")) cfg.llm.provider = l["provider"];
        if (l.contains("endpoint")) cfg.llm.endpoint = l["endpoint"];
        if (l.contains("model_name")) cfg.llm.model_name = l["model_name"];
        if (l.contains("api_key_env")) cfg.llm.api_key_env = l["api_key_env"];
        if (l.contains("timeout_ms")) cfg.llm.timeout_ms = l["timeout_ms"];
        if (l.contains("max_tokens")) cfg.llm.max_tokens = l["max_tokens"];
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
        if (l.contains("presence_penalty")) cfg.llm.presence_penalty = l["presence_penalty"];
        if (l.contains("frequency_penalty")) cfg.llm.frequency_penalty = l["frequency_penalty"];
        if (l.contains("context_max_turns")) cfg.llm.context_max_turns = l["context_max_turns"];
        if (l.contains("system_prompt")) cfg.llm.system_prompt = l["system_prompt"];
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        if (s.contains("max_history")) cfg.session.max_history = s["max_history"];
        if (s.contains("pre_speech_ms")) cfg.session.pre_speech_ms = s["pre_speech_ms"];
        if (s.contains("stop_flush_min_ms")) cfg.session.stop_flush_min_ms = s["stop_flush_min_ms"];
    }

    if (j.contains("log") && j["log"].is_object()) {
        auto& g = j["log"];
        if (g.contains("level")) cfg.log.level = g["level"];
        if (g.contains("file")) cfg.log.file = g["file"];
    }
}

void expand_paths(Config& cfg) {
    cfg.faq.database_path = expand_path(cfg.faq.database_path);
    cfg.faq.transcript_path = expand_path(cfg.faq.transcript_path);
    cfg.stt.model_path = expand_path(cfg.stt.model_path);
    cfg.tts.offline.executable = expand_path(cfg.tts.offline.executable);
    cfg.log.file = expand_path(cfg.log.file);
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        expand_paths(cfg);
        return cfg;
    }

    try {
        json j;
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()) + ". Using defaults.");
        cfg = Config();
    }

    expand_paths(cfg);
    return cfg;
}

bool Config::save_to_file(const std::string& path) const {
    json j;

    j["server"]["host"] = server.host;
    j["server"]["port"] = server.port;
    j["server"]["sample_rate"] = server.sample_rate;
    j["server"]["frame_ms"] = server.frame_ms;
    j["server"]["chunk_size"] = server.chunk_size;
    j["server"]["max_message_bytes"] = server.max_message_bytes;

    j["vad"]["threshold"] = vad.threshold;
    j["vad"]["min_speech_ms"] = vad.min_speech_ms;
    j["vad"]["hangover_ms"] = vad.hangover_ms;
    j["vad"]["max_speech_ms"] = vad.max_speech_ms;
    j["vad"]["use_model"] = vad.use_model;
    j["vad"]["model_mode"] = vad.model_mode;
    j["vad"]["energy_threshold"] = vad.energy_threshold;
    j["vad"]["energy_high_freq_threshold"] = vad.energy_high_freq_threshold;

    j["faq"]["enabled"] = faq.enabled;
    j["faq"]["database_path"] = faq.database_path;
    j["faq"]["transcript_path"] = faq.transcript_path;
    j["faq"]["similarity_threshold"] = faq.similarity_threshold;
    j["faq"]["min_query_words"] = faq.min_query_words;

    j["tts"]["output_sample_rate"] = tts.output_sample_rate;
    j["tts"]["cache_entries"] = tts.cache_entries;
    j["tts"]["neural"]["enabled"] = tts.neural.enabled;
    j["tts"]["neural"]["endpoint"] = tts.neural.endpoint;
    j["tts"]["neural"]["model"] = tts.neural.model;
    j["tts"]["neural"]["voice"] = tts.neural.voice;
    j["tts"]["neural"]["api_key_env"] = tts.neural.api_key_env;
    j["tts"]["neural"]["timeout_ms"] = tts.neural.timeout_ms;
    j["tts"]["neural"]["native_sample_rate"] = tts.neural.native_sample_rate;
    j["tts"]["neural"]["instructions"] = tts.neural.instructions;
    j["tts"]["offline"]["enabled"] = tts.offline.enabled;
    j["tts"]["offline"]["executable"] = tts.offline.executable;
    j["tts"]["offline"]["language"] = tts.offline.language;
    j["tts"]["offline"]["voice"] = tts.offline.voice;
    j["tts"]["offline"]["timeout_ms"] = tts.offline.timeout_ms;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["language"] = stt.language;
    j["stt"]["blank_sentinel"] = stt.blank_sentinel;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["threads"] = stt.threads;

    j["llm"]["provider"] = llm.provider;
    j["llm"]["endpoint"] = llm.endpoint;
    j["llm"]["model_name"] = llm.model_name;
    j["llm"]["api_key_env"] = llm.api_key_env;
    j["llm"]["timeout_ms"] = llm.timeout_ms;
    j["llm"]["max_tokens"] = llm.max_tokens;
    j["llm"]["temperature"] = llm.temperature;
    j["llm"]["presence_penalty"] = llm.presence_penalty;
    j["llm"]["frequency_penalty"] = llm.frequency_penalty;
    j["llm"]["context_max_turns"] = llm.context_max_turns;
    j["llm"]["system_prompt"] = llm.system_prompt;

    j["session"]["max_history"] = session.max_history;
    j["session"]["pre_speech_ms"] = session.pre_speech_ms;
    j["session"]["stop_flush_min_ms"] = session.stop_flush_min_ms;

    j["log"]["level"] = log.level;
    j["log"]["file"] = log.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return false;
    }
    file << j.dump(2);
    return static_cast<bool>(file);
}

std::string read_api_key(const std::string& env_name) {
    if (env_name.empty()) return "";
    const char* value = std::getenv(env_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace holo_oracle
