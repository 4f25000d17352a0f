#pragma once

/**
 * @file audio_codec.h
 * @brief PCM16 transport encoding, sample conversion, resampling and WAV I/O
 */

#include "core/types.h"
#include <string>
#include <vector>
#include <cstdint>

namespace holo_oracle {
namespace codec {

/// Standard base64 (RFC 4648) with '=' padding
std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode standard base64; whitespace is skipped
 * @return Decoded bytes, or failure on any character outside the alphabet
 */
Result<std::vector<uint8_t>> base64_decode(const std::string& text);

/// Little-endian PCM16 bytes to samples; an odd trailing byte is dropped
AudioBuffer pcm16_from_bytes(const std::vector<uint8_t>& bytes);

/// Samples to little-endian PCM16 bytes
std::vector<uint8_t> pcm16_to_bytes(const AudioBuffer& samples);

/// Convenience for the wire format: samples -> base64(PCM16 LE)
std::string encode_pcm16_base64(const AudioBuffer& samples);

/// Convenience for the wire format: base64(PCM16 LE) -> samples
Result<AudioBuffer> decode_pcm16_base64(const std::string& text);

/// int16 -> float in [-1, 1)
std::vector<float> to_float(const AudioBuffer& samples);

/// float -> int16 with clamping to [-1, 1]
AudioBuffer from_float(const std::vector<float>& samples);

/**
 * @brief Linear-interpolation resampler (no band-limiting)
 *
 * Output length is floor(input.size() * to_rate / from_rate). Returns the
 * input unchanged when the rates match or either rate is not positive.
 */
AudioBuffer resample_linear(const AudioBuffer& input, int from_rate, int to_rate);

/// Scale samples by gain in place with clamping
void apply_gain(AudioBuffer& samples, float gain);

/// Decoded WAV contents (first channel only)
struct WavData {
    AudioBuffer samples;
    int sample_rate = 0;
    int channels = 0;
};

/**
 * @brief Parse a RIFF/WAVE PCM16 file held in memory
 *
 * Walks the chunk list so LIST/fact chunks before "data" are tolerated.
 * Multi-channel audio is reduced to its first channel.
 */
Result<WavData> parse_wav(const std::vector<uint8_t>& bytes);

/// Read and parse a WAV file from disk
Result<WavData> read_wav_file(const std::string& path);

/// Serialize mono PCM16 as a canonical 44-byte-header WAV
std::vector<uint8_t> build_wav(const AudioBuffer& samples, int sample_rate);

/// Write mono PCM16 WAV to disk
VoidResult write_wav_file(const std::string& path, const AudioBuffer& samples, int sample_rate);

} // namespace codec
} // namespace holo_oracle
