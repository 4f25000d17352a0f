#pragma once

/**
 * @file protocol.h
 * @brief JSON messages exchanged with a client over the duplex connection
 *
 * Client -> server: start_listening, stop_listening, audio_chunk{data},
 * transcribed_text{text}, voice_settings{settings}, ping.
 * Server -> client: built by the make_* functions below.
 */

#include "core/types.h"
#include "tts/tts_interface.h"
#include <optional>
#include <string>
#include <vector>

namespace holo_oracle {
namespace protocol {

enum class InboundType {
    StartListening,
    StopListening,
    AudioChunk,
    TranscribedText,
    VoiceSettings,
    Ping
};

/// Partial voice settings update; absent fields keep their current value
struct VoiceSettingsUpdate {
    std::optional<int> speed;
    std::optional<float> volume;
    std::optional<float> intensity;
    std::optional<float> emotion;

    void apply_to(VoiceSettings& settings) const;
};

struct InboundMessage {
    InboundType type = InboundType::Ping;
    std::string data;               ///< audio_chunk: base64 PCM16
    std::string text;               ///< transcribed_text
    VoiceSettingsUpdate settings;   ///< voice_settings
};

/**
 * @brief Parse one client message
 *
 * Fails on invalid JSON, a non-object payload, a missing or non-string
 * type, or an unknown type. Missing optional fields default to empty.
 */
Result<InboundMessage> parse_inbound(const std::string& raw);

/// Contents of welcome.server_info
struct ServerInfo {
    int sample_rate = 0;
    int output_sample_rate = 0;
    int frame_ms = 0;
    int chunk_size = 0;
    std::vector<tts::EngineInfo> engines;
    size_t faq_entries = 0;
};

std::string make_welcome(const std::string& client_id, const ServerInfo& info);
std::string make_vad_result(float speech_probability, bool is_speech);
std::string make_status(const std::string& status);
std::string make_transcription(const std::string& text);
std::string make_faq_response(const std::string& text, float confidence);
std::string make_voice_response(const std::string& text, const AudioBuffer& audio, int sample_rate);
std::string make_text_response(const std::string& text);
std::string make_error(const std::string& message);
std::string make_pong();
std::string make_settings_updated(const VoiceSettings& settings);

} // namespace protocol
} // namespace holo_oracle
