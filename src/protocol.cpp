#include "protocol.h"
#include "audio_codec.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace holo_oracle {
namespace protocol {

namespace {

// All text goes through dump() with replacement so a stray invalid UTF-8
// byte from a backend cannot throw on the send path
std::string serialize(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

template<typename T>
std::optional<T> optional_number(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<T>();
    }
    return std::nullopt;
}

} // namespace

void VoiceSettingsUpdate::apply_to(VoiceSettings& settings) const {
    if (speed) settings.speed = *speed;
    if (volume) settings.volume = *volume;
    if (intensity) settings.intensity = *intensity;
    if (emotion) settings.emotion = *emotion;
}

Result<InboundMessage> parse_inbound(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::exception& e) {
        return Result<InboundMessage>::failure("Invalid JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        return Result<InboundMessage>::failure("Message is not a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return Result<InboundMessage>::failure("Message has no type");
    }

    InboundMessage msg;
    std::string type = j["type"].get<std::string>();

    if (type == "start_listening") {
        msg.type = InboundType::StartListening;
    } else if (type == "stop_listening") {
        msg.type = InboundType::StopListening;
    } else if (type == "audio_chunk") {
        msg.type = InboundType::AudioChunk;
        if (j.contains("data") && j["data"].is_string()) {
            msg.data = j["data"].get<std::string>();
        }
    } else if (type == "transcribed_text") {
        msg.type = InboundType::TranscribedText;
        if (j.contains("text") && j["text"].is_string()) {
            msg.text = j["text"].get<std::string>();
        }
    } else if (type == "voice_settings") {
        msg.type = InboundType::VoiceSettings;
        if (j.contains("settings") && j["settings"].is_object()) {
            const json& s = j["settings"];
            msg.settings.speed = optional_number<int>(s, "speed");
            msg.settings.volume = optional_number<float>(s, "volume");
            msg.settings.intensity = optional_number<float>(s, "intensity");
            msg.settings.emotion = optional_number<float>(s, "emotion");
        }
    } else if (type == "ping") {
        msg.type = InboundType::Ping;
    } else {
        return Result<InboundMessage>::failure("Unknown message type: " + type);
    }

    return Result<InboundMessage>::success(std::move(msg));
}

std::string make_welcome(const std::string& client_id, const ServerInfo& info) {
    json engines = json::array();
    for (const auto& engine : info.engines) {
        engines.push_back({{"name", engine.name}, {"available", engine.available}});
    }

    json j;
    j["type"] = "welcome";
    j["client_id"] = client_id;
    j["server_info"] = {
        {"sample_rate", info.sample_rate},
        {"output_sample_rate", info.output_sample_rate},
        {"frame_ms", info.frame_ms},
        {"chunk_size", info.chunk_size},
        {"supported_formats", json::array({"pcm16"})},
        {"engines", engines},
        {"faq_entries", info.faq_entries}
    };
    return serialize(j);
}

std::string make_vad_result(float speech_probability, bool is_speech) {
    return serialize({{"type", "vad_result"},
                      {"speech_probability", speech_probability},
                      {"is_speech", is_speech}});
}

std::string make_status(const std::string& status) {
    return serialize({{"type", "status"}, {"status", status}});
}

std::string make_transcription(const std::string& text) {
    return serialize({{"type", "transcription"}, {"text", text}});
}

std::string make_faq_response(const std::string& text, float confidence) {
    return serialize({{"type", "faq_response"}, {"text", text}, {"confidence", confidence}});
}

std::string make_voice_response(const std::string& text, const AudioBuffer& audio, int sample_rate) {
    return serialize({{"type", "voice_response"},
                      {"text", text},
                      {"audio_data", codec::encode_pcm16_base64(audio)},
                      {"sample_rate", sample_rate}});
}

std::string make_text_response(const std::string& text) {
    return serialize({{"type", "text_response"}, {"text", text}});
}

std::string make_error(const std::string& message) {
    return serialize({{"type", "error"}, {"message", message}});
}

std::string make_pong() {
    return serialize({{"type", "pong"}});
}

std::string make_settings_updated(const VoiceSettings& settings) {
    return serialize({{"type", "settings_updated"},
                      {"settings", {{"speed", settings.speed},
                                    {"volume", settings.volume},
                                    {"intensity", settings.intensity},
                                    {"emotion", settings.emotion}}}});
}

} // namespace protocol
} // namespace holo_oracle
